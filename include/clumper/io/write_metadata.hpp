#pragma once

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <seqan3/std/filesystem>

#include <clumper/cluster/clustering_engine.hpp>
#include <clumper/cluster/group.hpp>
#include <clumper/io/write_report.hpp>

inline void to_json(nlohmann::json & json_obj, group const & g)
{
    json_obj = {
        {"group_id", g.id()},
        {"item_ids", g.item_ids()},
        {"item_count", g.size()},
        {"total_weight", g.total_weight()}
    };
}

inline void to_json(nlohmann::json & json_obj, clustering_statistics const & stats)
{
    json_obj = {
        {"total_items", stats.num_items},
        {"merges", stats.iterations},
        {"average_group_weight", stats.avg_group_weight},
        {"min_group_weight", stats.min_group_weight},
        {"max_group_weight", stats.max_group_weight},
        {"average_items_per_group", stats.avg_items_per_group},
        {"min_items_per_group", stats.min_items_per_group},
        {"max_items_per_group", stats.max_items_per_group},
        {"reduction_rate_percent", stats.reduction_rate}
    };
}

inline std::string metadata_filename(size_t const group_id)
{
    return "group_" + std::to_string(group_id) + "_metadata.json";
}

namespace detail
{

inline void write_json(nlohmann::json const & json_obj, std::filesystem::path const & path)
{
    std::ofstream fout{path};

    if (!fout.good())
        throw std::runtime_error{"Could not open " + path.string() + " for writing."};

    // item ids come from user input and need not be valid UTF-8
    fout << json_obj.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';

    if (!fout.good())
        throw std::runtime_error{"Writing " + path.string() + " failed."};
}

} // namespace detail

/*!\brief Write the metadata file of one group, group_<id>_metadata.json.
 * \param[in] g the group
 * \param[in] output_dir an existing directory
 * \returns the path of the written file
 */
inline std::filesystem::path write_group_metadata(group const & g, std::filesystem::path const & output_dir)
{
    std::filesystem::path const path = output_dir / metadata_filename(g.id());
    detail::write_json(g, path);
    return path;
}

/*!\brief Write the metadata of a clustering run as JSON.
 * \param[in] result the result of clustering_engine::cluster()
 * \param[in] num_items the number of input items
 * \param[in] output_dir the directory to write to, created if needed
 * \returns the path of the summary file
 *
 * The summary file groups_summary.json lists every group and the summary statistics of the run.
 * The summary statistics are an empty object if there are no groups.
 * In addition, every group gets its own file (see write_group_metadata()).
 *
 * \throws std::runtime_error if a file cannot be written
 */
inline std::filesystem::path write_metadata(clustering_result const & result,
                                            size_t const num_items,
                                            std::filesystem::path const & output_dir)
{
    if (!std::filesystem::exists(output_dir))
        std::filesystem::create_directories(output_dir);

    nlohmann::json summary = {
        {"total_groups", result.groups.size()},
        {"groups", result.groups},
        {"summary", nlohmann::json::object()}
    };

    if (!result.groups.empty())
        summary["summary"] = compute_statistics(result, num_items);

    std::filesystem::path const path = output_dir / "groups_summary.json";
    detail::write_json(summary, path);

    for (auto const & g : result.groups)
        write_group_metadata(g, output_dir);

    return path;
}
