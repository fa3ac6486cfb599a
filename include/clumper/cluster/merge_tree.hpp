#pragma once

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <clumper/cluster/group.hpp>
#include <clumper/cluster/merge_record.hpp>

#include <robin_hood.h>

//!\brief A node of the dendrogram. Leaves have no children.
struct merge_node
{
    size_t group_id;
    // all items reachable from this node
    std::vector<item> items;
    // children in the tree
    std::unique_ptr<merge_node> left;
    std::unique_ptr<merge_node> right;
    // distance of the children when they were merged, 0 for leaves
    double merge_distance{0.0};
    double total_weight{0.0};

    static std::unique_ptr<merge_node> leaf(group const & g)
    {
        auto node = std::make_unique<merge_node>();
        node->group_id = g.id();
        node->items = g.items();
        node->total_weight = g.total_weight();
        return node;
    }

    bool is_leaf() const noexcept
    {
        return !left && !right;
    }

    //!\brief 1 for a leaf, 1 + the height of the higher subtree otherwise.
    size_t height() const
    {
        if (is_leaf())
            return 1;

        size_t const left_height = left ? left->height() : 0;
        size_t const right_height = right ? right->height() : 0;
        return 1 + std::max(left_height, right_height);
    }

    //!\brief The item ids of all leaves, depth first and left before right.
    std::vector<std::string> leaf_ids() const
    {
        std::vector<std::string> ids;
        collect_leaf_ids(ids);
        return ids;
    }

private:
    void collect_leaf_ids(std::vector<std::string> & ids) const
    {
        if (is_leaf())
        {
            for (auto const & i : items)
                ids.push_back(i.id());
            return;
        }

        if (left)
            left->collect_leaf_ids(ids);
        if (right)
            right->collect_leaf_ids(ids);
    }
};

struct tree_statistics
{
    size_t total_trees{};
    size_t total_merges{};
    size_t max_height{};
    size_t total_leaves{};
};

/*!\brief The merge history of a clustering run and the forest that can be built from it.
 *
 * The history is an ordered log of all accepted merges. If the seed groups were registered with add_seed(),
 * the subtree of every live group is kept while merges are recorded, so the full binary history of the
 * final groups can be materialised with build_from_history().
 */
class merge_tree
{
private:
    //!\brief The ordered log of all accepted merges.
    std::vector<merge_record> history;

    //!\brief The subtrees of the live groups, keyed by group id.
    robin_hood::unordered_map<size_t, std::unique_ptr<merge_node>> subtrees;

    //!\brief One root per final group after one of the build functions was called.
    std::vector<std::unique_ptr<merge_node>> roots_;

    static std::string format_fixed(double const value, int const precision)
    {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(precision) << value;
        return ss.str();
    }

    void print_node(std::ostream & out, merge_node const & node, std::string const & prefix, bool const is_last) const
    {
        out << prefix << (is_last ? "└── " : "├── ") << "group " << node.group_id
            << " (" << format_fixed(node.total_weight, 1) << ')';

        if (node.is_leaf())
        {
            out << " [";
            size_t const shown = std::min<size_t>(node.items.size(), 3);
            for (size_t i = 0; i < shown; ++i)
                out << (i == 0 ? "" : ", ") << node.items[i].id();
            if (node.items.size() > shown)
                out << "... (+" << node.items.size() - shown << ')';
            out << "]\n";
            return;
        }

        out << " [distance=" << format_fixed(node.merge_distance, 1) << "]\n";

        std::string const child_prefix = prefix + (is_last ? "    " : "│   ");
        if (node.left)
            print_node(out, *node.left, child_prefix, !node.right);
        if (node.right)
            print_node(out, *node.right, child_prefix, true);
    }

public:
    //!\brief Register a seed group as a leaf so that its history can be reconstructed.
    void add_seed(group const & seed)
    {
        subtrees[seed.id()] = merge_node::leaf(seed);
    }

    /*!\brief Append a merge to the history.
     * \param[in] parent_a_id id of the parent whose items come first in the child
     * \param[in] parent_b_id id of the other parent
     * \param[in] child_id id of the group that replaced both parents
     * \param[in] distance single-linkage distance of the parents at merge time
     */
    void record_merge(size_t const parent_a_id, size_t const parent_b_id, size_t const child_id, double const distance)
    {
        history.push_back({parent_a_id, parent_b_id, child_id, distance});

        auto left_it = subtrees.find(parent_a_id);
        auto right_it = subtrees.find(parent_b_id);

        // without registered seeds only the log is kept
        if (left_it == subtrees.end() || right_it == subtrees.end())
            return;

        auto node = std::make_unique<merge_node>();
        node->group_id = child_id;
        node->left = std::move(left_it->second);
        node->right = std::move(right_it->second);
        node->items = node->left->items;
        node->items.insert(node->items.end(), node->right->items.begin(), node->right->items.end());
        node->merge_distance = distance;
        node->total_weight = node->left->total_weight + node->right->total_weight;

        subtrees.erase(parent_a_id);
        subtrees.erase(parent_b_id);
        subtrees[child_id] = std::move(node);
    }

    /*!\brief Build one leaf per final group.
     * \param[in] final_groups the groups that were left when the clustering terminated
     */
    void build_from_final_groups(std::vector<group> const & final_groups)
    {
        roots_.clear();
        for (auto const & g : final_groups)
            roots_.push_back(merge_node::leaf(g));
    }

    /*!\brief Build one full binary tree per final group from the retained subtrees.
     *
     * The retained subtrees are moved into the forest. Final groups without a retained subtree
     * (no seeds were registered) become leaves.
     * \param[in] final_groups the groups that were left when the clustering terminated
     */
    void build_from_history(std::vector<group> const & final_groups)
    {
        roots_.clear();
        for (auto const & g : final_groups)
        {
            auto it = subtrees.find(g.id());
            if (it != subtrees.end() && it->second)
            {
                roots_.push_back(std::move(it->second));
                subtrees.erase(g.id());
            }
            else
            {
                roots_.push_back(merge_node::leaf(g));
            }
        }
    }

    std::vector<merge_record> const & merge_history() const noexcept
    {
        return history;
    }

    std::vector<std::unique_ptr<merge_node>> const & roots() const noexcept
    {
        return roots_;
    }

    tree_statistics statistics() const
    {
        tree_statistics stats{};
        stats.total_trees = roots_.size();
        stats.total_merges = history.size();

        for (auto const & root : roots_)
        {
            stats.max_height = std::max(stats.max_height, root->height());
            stats.total_leaves += root->leaf_ids().size();
        }

        return stats;
    }

    //!\brief Render every tree of the forest.
    void print(std::ostream & out) const
    {
        for (size_t i = 0; i < roots_.size(); ++i)
        {
            out << "Tree " << i + 1 << " (group " << roots_[i]->group_id << "):\n";
            print_node(out, *roots_[i], "", true);
            out << '\n';
        }
    }

    void print_merge_history(std::ostream & out) const
    {
        if (history.empty())
        {
            out << "No merges recorded\n";
            return;
        }

        for (size_t i = 0; i < history.size(); ++i)
        {
            merge_record const & r = history[i];
            out << "Merge " << i + 1 << ": group " << r.parent_a_id << " + group " << r.parent_b_id
                << " -> group " << r.child_id << " (distance: " << format_fixed(r.distance, 2) << ")\n";
        }
    }
};
