#pragma once

#include <ios>
#include <limits>
#include <ostream>
#include <vector>

#include <clumper/cluster/group.hpp>
#include <clumper/cluster/merge_record.hpp>

/*!\brief Write one line per group: its id, the ids of its items in concatenation order and its total weight.
 * \param[in] groups the final groups
 * \param[in] out the stream to write to
 *
 * The total weight is written with enough digits to be read back exactly.
 */
inline void write_group_file(std::vector<group> const & groups, std::ostream & out)
{
    std::streamsize const precision = out.precision(std::numeric_limits<double>::max_digits10);

    out << "#GROUP_ID\tITEM_IDS\tTOTAL_WEIGHT\n";

    for (auto const & g : groups)
    {
        out << g.id() << '\t';

        auto const & items = g.items();
        out << items[0].id();
        for (size_t i = 1; i < items.size(); ++i)
            out << ';' << items[i].id();

        out << '\t' << g.total_weight() << '\n';
    }

    out.precision(precision);
}

//!\brief Write one line per merge record in the order the merges happened.
inline void write_merge_log(std::vector<merge_record> const & merge_log, std::ostream & out)
{
    std::streamsize const precision = out.precision(std::numeric_limits<double>::max_digits10);

    out << "#PARENT_A\tPARENT_B\tCHILD\tDISTANCE\n";

    for (auto const & r : merge_log)
        out << r.parent_a_id << '\t' << r.parent_b_id << '\t' << r.child_id << '\t' << r.distance << '\n';

    out.precision(precision);
}
