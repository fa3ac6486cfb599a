#pragma once

#include <cstddef>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <clumper/item/item.hpp>

/*!\brief Hands out group ids for one clustering run.
 *
 * Ids start at 1 and are never reused within a run, not even after the group that
 * carried the id was merged away. Every run owns its own counter.
 */
class group_id_counter
{
private:
    size_t last{0};

public:
    //!\brief Return the next unused id.
    size_t next() noexcept
    {
        return ++last;
    }

    //!\brief Start over at 1, e.g. for a new run.
    void reset() noexcept
    {
        last = 0;
    }

    //!\brief The number of ids that were handed out since the last reset.
    size_t issued() const noexcept
    {
        return last;
    }
};

//!\brief A set of items that is treated as one unit after zero or more merges.
class group
{
private:
    //!\brief The id assigned at creation.
    size_t group_id_;

    //!\brief The members in merge order.
    std::vector<item> items_;

    //!\brief Cached sum of the member weights.
    double total_weight_;

    group(size_t const group_id_in, std::vector<item> items_in) :
        group_id_{group_id_in},
        items_{std::move(items_in)},
        total_weight_{std::accumulate(items_.begin(), items_.end(), 0.0,
                                      [] (double const sum, item const & i) { return sum + i.weight(); })}
    {}

public:
    /*!\brief Create a seed group that holds exactly one item.
     * \param[in] seed the item
     * \param[in] ids the counter to draw the new id from
     */
    group(item const & seed, group_id_counter & ids) :
        group{ids.next(), std::vector<item>{seed}}
    {}

    /*!\brief Create the union of two groups. The items of `first` come before the items of `second`.
     * \param[in] first the group whose items come first
     * \param[in] second the group whose items are appended
     * \param[in] ids the counter to draw the new id from
     */
    static group merge(group const & first, group const & second, group_id_counter & ids)
    {
        std::vector<item> members;
        members.reserve(first.items_.size() + second.items_.size());
        members.insert(members.end(), first.items_.begin(), first.items_.end());
        members.insert(members.end(), second.items_.begin(), second.items_.end());

        return group{ids.next(), std::move(members)};
    }

    size_t id() const noexcept
    {
        return group_id_;
    }

    std::vector<item> const & items() const noexcept
    {
        return items_;
    }

    size_t size() const noexcept
    {
        return items_.size();
    }

    double total_weight() const noexcept
    {
        return total_weight_;
    }

    //!\brief The identifiers of the members in concatenation order.
    std::vector<std::string> item_ids() const
    {
        std::vector<std::string> ids;
        ids.reserve(items_.size());

        for (auto const & i : items_)
            ids.push_back(i.id());

        return ids;
    }

    /*!\brief Whether the union with `other` would stay within the capacity ceiling.
     * \param[in] other the potential merge partner
     * \param[in] capacity the maximal allowed total weight of a group
     */
    bool can_merge_with(group const & other, double const capacity) const noexcept
    {
        return total_weight_ + other.total_weight_ <= capacity;
    }
};
