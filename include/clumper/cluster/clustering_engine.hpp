#pragma once

#include <cmath>
#include <cstddef>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <clumper/cluster/distance_index.hpp>
#include <clumper/cluster/group.hpp>
#include <clumper/cluster/merge_record.hpp>
#include <clumper/cluster/merge_tree.hpp>
#include <clumper/item/item.hpp>

//!\brief The phases of one clustering run. A run never returns to an earlier phase.
enum class engine_state
{
    initialized,
    seeding,
    agglomerating,
    terminated
};

//!\brief What a clustering run hands back to its caller.
struct clustering_result
{
    //!\brief The final groups in the order of the distance index at termination.
    std::vector<group> groups;

    //!\brief The merge history and the subtrees of the final groups.
    merge_tree tree;

    //!\brief Whether the loop stopped because no pair fit into the capacity ceiling.
    bool stopped_early{false};

    std::vector<merge_record> const & merge_log() const noexcept
    {
        return tree.merge_history();
    }
};

/*!\brief Greedy agglomerative clustering with single linkage and a capacity ceiling.
 *
 * Every item starts in its own group. As long as more than one group is left, the pair with the smallest
 * distance whose combined weight does not exceed the capacity ceiling is merged. The loop ends when a single
 * group is left or when no pair fits into the ceiling anymore.
 */
class clustering_engine
{
private:
    //!\brief The id counter, reset at the start of every run.
    group_id_counter ids;

    //!\brief The phase of the latest run.
    engine_state state_{engine_state::initialized};

    //!\brief Where progress is reported. Nothing is reported if this is nullptr.
    std::ostream * log;

public:
    /*!\brief A clustering engine.
     * \param[in] log_ optional stream for progress messages, e.g. &std::cerr in verbose mode
     */
    explicit clustering_engine(std::ostream * log_ = nullptr) :
        log{log_}
    {}

    /*!\brief Cluster the items into groups whose total weight stays within the capacity ceiling.
     * \param[in] items the input items, duplicated ids are allowed and are not merged up front
     * \param[in] capacity the maximal total weight of a group, must be > 0
     * \returns the final groups and the merge history
     *
     * \throws std::invalid_argument if capacity is not a positive number. No state is changed in that case.
     */
    clustering_result cluster(std::vector<item> const & items, double const capacity)
    {
        if (!(capacity > 0) || !std::isfinite(capacity))
        {
            std::stringstream ss;
            ss << "The capacity ceiling must be a positive number but is " << capacity << '.';
            throw std::invalid_argument{ss.str()};
        }

        state_ = engine_state::seeding;
        ids.reset();

        clustering_result result{};

        if (items.empty())
        {
            state_ = engine_state::terminated;
            return result;
        }

        if (log)
            *log << "[CLUMPER] Clustering " << items.size() << " items with a capacity ceiling of "
                 << capacity << ".\n";

        std::vector<group> seeds;
        seeds.reserve(items.size());
        for (auto const & i : items)
        {
            seeds.emplace_back(i, ids);
            result.tree.add_seed(seeds.back());
        }

        distance_index index{ids};
        index.build(std::move(seeds));

        state_ = engine_state::agglomerating;

        while (index.size() > 1)
        {
            bool merged_something{false};

            for (auto const & [i, j, dist] : index.sorted_pairs())
            {
                group const & first = index.at(i);
                group const & second = index.at(j);

                if (!first.can_merge_with(second, capacity))
                    continue;

                size_t const first_id = first.id();
                size_t const second_id = second.id();
                double const first_weight = first.total_weight();
                double const second_weight = second.total_weight();

                // invalidates first and second
                group const & child = index.merge(i, j);
                result.tree.record_merge(first_id, second_id, child.id(), dist);

                if (log)
                    *log << "[CLUMPER] Merge " << result.merge_log().size() << ": group " << first_id
                         << " (" << first_weight << ") + group " << second_id << " (" << second_weight
                         << ") -> group " << child.id() << " (" << child.total_weight() << ", "
                         << child.size() << " items), distance " << dist << ". "
                         << index.size() << " groups remain.\n";

                merged_something = true;
                break;
            }

            if (!merged_something)
            {
                result.stopped_early = true;
                if (log)
                    *log << "[CLUMPER] No further merge possible within the capacity ceiling.\n";
                break;
            }
        }

        result.groups = index.release();
        state_ = engine_state::terminated;

        if (log)
            *log << "[CLUMPER] Finished with " << result.groups.size() << " groups after "
                 << result.merge_log().size() << " merges.\n";

        return result;
    }

    engine_state state() const noexcept
    {
        return state_;
    }
};
