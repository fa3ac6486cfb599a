#pragma once

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <clumper/cluster/clustering_engine.hpp>
#include <clumper/io/metadata_footprint.hpp>

struct clustering_statistics
{
    size_t num_groups{};
    size_t num_items{};
    size_t iterations{};
    double avg_group_weight{};
    double min_group_weight{};
    double max_group_weight{};
    double avg_items_per_group{};
    size_t min_items_per_group{};
    size_t max_items_per_group{};
    //!\brief (1 - groups / items) * 100, 0 if there are no items
    double reduction_rate{};
};

/*!\brief Summarise a clustering run.
 * \param[in] result the result of clustering_engine::cluster()
 * \param[in] num_items the number of input items
 */
inline clustering_statistics compute_statistics(clustering_result const & result, size_t const num_items)
{
    clustering_statistics stats{};
    stats.num_groups = result.groups.size();
    stats.num_items = num_items;
    stats.iterations = result.merge_log().size();

    if (num_items > 0)
        stats.reduction_rate = (1.0 - static_cast<double>(stats.num_groups) / num_items) * 100.0;

    if (result.groups.empty())
        return stats;

    stats.min_group_weight = result.groups[0].total_weight();
    stats.min_items_per_group = result.groups[0].size();

    double weight_sum{0};
    size_t item_sum{0};

    for (auto const & g : result.groups)
    {
        weight_sum += g.total_weight();
        item_sum += g.size();
        stats.min_group_weight = std::min(stats.min_group_weight, g.total_weight());
        stats.max_group_weight = std::max(stats.max_group_weight, g.total_weight());
        stats.min_items_per_group = std::min(stats.min_items_per_group, g.size());
        stats.max_items_per_group = std::max(stats.max_items_per_group, g.size());
    }

    stats.avg_group_weight = weight_sum / stats.num_groups;
    stats.avg_items_per_group = static_cast<double>(item_sum) / stats.num_groups;

    return stats;
}

/*!\brief Write a human readable report of a clustering run.
 *
 * Groups are listed by ascending id, the members of a group by ascending item id.
 * The report ends with summary statistics and the metadata footprint before and after merging.
 */
inline void write_report(clustering_result const & result,
                         size_t const num_items,
                         metadata_footprint const & footprint,
                         std::ostream & out)
{
    clustering_statistics const stats = compute_statistics(result, num_items);
    footprint_report const memory = footprint.compare(num_items, stats.num_groups);

    std::string const rule(80, '=');
    std::string const thin_rule(80, '-');

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);

    ss << rule << '\n'
       << "CLUMPER GROUPING REPORT\n"
       << rule << "\n\n"
       << "Input items: " << num_items << '\n'
       << "Groups: " << stats.num_groups << '\n'
       << "Merges: " << stats.iterations << '\n'
       << "Reduction rate: " << stats.reduction_rate << "%\n\n"
       << thin_rule << '\n'
       << "GROUPS\n"
       << thin_rule << "\n\n";

    std::vector<group const *> sorted_groups;
    for (auto const & g : result.groups)
        sorted_groups.push_back(&g);
    std::sort(sorted_groups.begin(), sorted_groups.end(), [] (group const * a, group const * b)
    {
        return a->id() < b->id();
    });

    for (group const * g : sorted_groups)
    {
        std::vector<item> members = g->items();
        std::stable_sort(members.begin(), members.end(), [] (item const & a, item const & b)
        {
            return a.id() < b.id();
        });

        ss << "Group " << g->id() << '\n'
           << "  Items: " << g->size() << '\n'
           << "  Total weight: " << g->total_weight() << '\n'
           << "  Members:\n";
        for (auto const & i : members)
            ss << "    - " << i.id() << " (" << i.weight() << ")\n";
        ss << '\n';
    }

    ss << thin_rule << '\n'
       << "STATISTICS\n"
       << thin_rule << "\n\n";

    if (stats.num_groups > 0)
    {
        ss << "Average group weight: " << stats.avg_group_weight << '\n'
           << "Smallest group weight: " << stats.min_group_weight << '\n'
           << "Largest group weight: " << stats.max_group_weight << '\n'
           << "Average items per group: " << stats.avg_items_per_group << '\n'
           << "Fewest items in a group: " << stats.min_items_per_group << '\n'
           << "Most items in a group: " << stats.max_items_per_group << "\n\n";
    }

    ss << "Metadata entries before merging: " << memory.items << " x " << memory.entry_bytes << " bytes = "
       << metadata_footprint::format_bytes(memory.original_bytes) << '\n'
       << "Metadata entries after merging: " << memory.groups << " x " << memory.entry_bytes << " bytes = "
       << metadata_footprint::format_bytes(memory.merged_bytes) << '\n'
       << "Metadata saved: " << metadata_footprint::format_bytes(memory.saved_bytes)
       << " (" << memory.reduction_percentage << "%)\n\n"
       << rule << '\n';

    out << ss.str();
}
