#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <clumper/cluster/group.hpp>

class distance_index
{
public:
    //!\brief An unordered pair of live groups (by position, i < j) and their distance.
    struct candidate_pair
    {
        size_t i;
        size_t j;
        double dist;

        bool operator==(candidate_pair const & other) const = default;
    };

private:
    //!\brief The live groups. The position of a group is not a stable identity.
    std::vector<group> live;

    /*!\brief The symmetric distance table between the live groups.
     *
     * dist[i][j] is the single-linkage distance between live[i] and live[j].
     * The diagonal is zero and never consulted.
     */
    std::vector<std::vector<double>> dist;

    //!\brief The counter of the current run. Merged groups draw their id from it.
    group_id_counter & ids;

    void check_index(size_t const i) const
    {
        if (i >= live.size())
        {
            std::stringstream ss;
            ss << "Group index " << i << " is out of range for " << live.size() << " live groups.";
            throw std::out_of_range{ss.str()};
        }
    }

public:
    /*!\brief Distance index for the single-linkage clustering of groups by their weight
     * \param[in] ids_ the id counter of the clustering run
     */
    explicit distance_index(group_id_counter & ids_) :
        ids{ids_}
    {}

    /*!\brief Compute the full pairwise distance table, |w(i) - w(j)| for all pairs.
     * \param[in] groups the seed groups, must not be empty
     *
     * \throws std::invalid_argument if groups is empty
     */
    void build(std::vector<group> groups)
    {
        if (groups.empty())
            throw std::invalid_argument{"The distance index cannot be built from zero groups."};

        live = std::move(groups);
        size_t const n = live.size();

        dist.assign(n, std::vector<double>(n, 0.0));

        for (size_t i = 0; i < n; ++i)
        {
            for (size_t j = i + 1; j < n; ++j)
            {
                double const d = std::abs(live[i].total_weight() - live[j].total_weight());
                dist[i][j] = d;
                dist[j][i] = d;
            }
        }
    }

    /*!\brief All live pairs sorted ascending by distance.
     *
     * Pairs with equal distance keep their enumeration order (ascending i, then ascending j).
     * The capacity ceiling is not considered here.
     */
    std::vector<candidate_pair> sorted_pairs() const
    {
        size_t const n = live.size();
        std::vector<candidate_pair> pairs;
        if (n > 1)
            pairs.reserve(n * (n - 1) / 2);

        for (size_t i = 0; i < n; ++i)
            for (size_t j = i + 1; j < n; ++j)
                pairs.push_back({i, j, dist[i][j]});

        std::stable_sort(pairs.begin(), pairs.end(), [] (candidate_pair const & a, candidate_pair const & b)
        {
            return a.dist < b.dist;
        });

        return pairs;
    }

    /*!\brief Merge two live groups into a new group and update the distance table.
     *
     * The items of the group at the lower index come first in the new group.
     * Both parents are removed, the new group is appended at the end.
     * The distance of the new group to every surviving group k is min(dist(i, k), dist(j, k)).
     * All other distances are kept as they are.
     *
     * \param[in] i index of the first group
     * \param[in] j index of the second group
     * \returns the newly created group
     *
     * \throws std::out_of_range if i or j is not a live index
     * \throws std::invalid_argument if i == j
     */
    group const & merge(size_t i, size_t j)
    {
        check_index(i);
        check_index(j);

        if (i == j)
        {
            std::stringstream ss;
            ss << "A group cannot be merged with itself (index " << i << ").";
            throw std::invalid_argument{ss.str()};
        }

        if (i > j)
            std::swap(i, j);

        group merged = group::merge(live[i], live[j], ids);

        // single-linkage distances from the merged group to every survivor, in survivor order
        std::vector<double> new_row;
        new_row.reserve(live.size() - 1);
        for (size_t k = 0; k < live.size(); ++k)
        {
            if (k != i && k != j)
                new_row.push_back(std::min(dist[i][k], dist[j][k]));
        }

        // remove j first, it is the larger index
        dist.erase(dist.begin() + j);
        dist.erase(dist.begin() + i);
        for (auto & row : dist)
        {
            row.erase(row.begin() + j);
            row.erase(row.begin() + i);
        }
        live.erase(live.begin() + j);
        live.erase(live.begin() + i);

        for (size_t k = 0; k < dist.size(); ++k)
            dist[k].push_back(new_row[k]);
        new_row.push_back(0.0);
        dist.push_back(std::move(new_row));
        live.push_back(std::move(merged));

        return live.back();
    }

    //!\brief The distance between the live groups at position i and j.
    double distance(size_t const i, size_t const j) const
    {
        check_index(i);
        check_index(j);
        return dist[i][j];
    }

    group const & at(size_t const i) const
    {
        check_index(i);
        return live[i];
    }

    std::vector<group> const & groups() const noexcept
    {
        return live;
    }

    //!\brief Give up ownership of the live groups, e.g. when the clustering is done.
    std::vector<group> release()
    {
        std::vector<group> result = std::move(live);
        live.clear();
        dist.clear();
        return result;
    }

    //!\brief Number of live groups (NOT number of distances)
    size_t size() const noexcept
    {
        return live.size();
    }
};
