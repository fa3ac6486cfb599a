#include <chrono>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include <seqan3/argument_parser/all.hpp>
#include <seqan3/std/filesystem>

#include <clumper/cluster/clumper_cluster.hpp>
#include <clumper/cluster/cluster_config.hpp>
#include <clumper/cluster/clustering_engine.hpp>
#include <clumper/io/container_writer.hpp>
#include <clumper/io/metadata_footprint.hpp>
#include <clumper/io/write_group_file.hpp>
#include <clumper/io/write_metadata.hpp>
#include <clumper/io/write_report.hpp>
#include <clumper/item/read_item_file.hpp>
#include <clumper/print_peak_memory_usage.hpp>

void initialize_argument_parser(seqan3::argument_parser & parser, cluster_config & config)
{
    parser.info.author = "clumper developers";
    parser.info.short_description = "Group small items into capacity bounded groups.";
    parser.info.version = "1.0.0";
    parser.info.description.push_back("Items are clustered with greedy agglomerative single-linkage clustering on "
                                      "their weights. Two groups are only merged if their total weight stays within "
                                      "the capacity ceiling.");
    parser.info.examples.push_back("clumper cluster -f items.tsv -c 128 -o groups.tsv");

    parser.add_option(config.data_file, 'f', "input-file",
                      "A tab separated file with one item per line: <id>\\t<weight>.",
                      seqan3::option_spec::required, seqan3::input_file_validator{});
    parser.add_option(config.capacity, 'c', "capacity",
                      "The maximal total weight of a group. Must be positive.",
                      seqan3::option_spec::standard,
                      seqan3::arithmetic_range_validator{std::numeric_limits<double>::min(),
                                                         std::numeric_limits<double>::max()});
    parser.add_option(config.output_filename, 'o', "output-filename",
                      "The final groups are written to this file.");
    parser.add_option(config.merge_log_filename, 'm', "merge-log",
                      "If given, the merge history is written to this file.");
    parser.add_option(config.report_filename, 'r', "report",
                      "If given, a human readable report is written to this file.");
    parser.add_option(config.container_dir, 'd', "container-dir",
                      "If given, one container per group is written to this directory.");
    parser.add_option(config.metadata_dir, 'j', "metadata-dir",
                      "If given, a JSON summary and one JSON metadata file per group are written to this directory.");
    parser.add_option(config.bytes_per_unit, 'b', "bytes-per-unit",
                      "The number of container bytes per unit of item weight.",
                      seqan3::option_spec::advanced,
                      seqan3::arithmetic_range_validator{size_t{1}, std::numeric_limits<size_t>::max()});
    parser.add_option(config.entry_bytes, 'e', "entry-bytes",
                      "The metadata bytes a storage system spends per stored file, used in the report.",
                      seqan3::option_spec::advanced);
    parser.add_flag(config.print_tree, 'p', "print-tree",
                    "Print the dendrogram of the final groups and the merge history to stdout.");
    parser.add_flag(config.full_history, '\0', "full-history",
                    "Print the full merge history of every final group instead of one leaf per group.");
    parser.add_flag(config.verbose, 'v', "verbose",
                    "Report the progress of the clustering, the run time and the peak memory usage on stderr.");
}

namespace detail
{

inline std::ofstream open_output(std::filesystem::path const & path)
{
    std::ofstream fout{path};

    if (!fout.good())
        throw std::runtime_error{"Could not open " + path.string() + " for writing."};

    return fout;
}

inline void write_outputs(cluster_config const & config, clustering_result & result, size_t const num_items)
{
    {
        std::ofstream fout = open_output(config.output_filename);
        write_group_file(result.groups, fout);
    }

    if (!config.merge_log_filename.empty())
    {
        std::ofstream fout = open_output(config.merge_log_filename);
        write_merge_log(result.merge_log(), fout);
    }

    if (!config.report_filename.empty())
    {
        std::ofstream fout = open_output(config.report_filename);
        write_report(result, num_items, metadata_footprint{config.entry_bytes}, fout);
    }

    if (!config.container_dir.empty())
    {
        container_writer writer{config.container_dir, config.bytes_per_unit};
        auto const paths = writer.write_all(result.groups);

        if (config.verbose)
            std::cerr << "[CLUMPER] Wrote " << paths.size() << " containers to "
                      << config.container_dir.string() << ".\n";
    }

    if (!config.metadata_dir.empty())
    {
        write_metadata(result, num_items, config.metadata_dir);

        if (config.verbose)
            std::cerr << "[CLUMPER] Wrote the group metadata to " << config.metadata_dir.string() << ".\n";
    }

    if (config.print_tree)
    {
        if (config.full_history)
            result.tree.build_from_history(result.groups);
        else
            result.tree.build_from_final_groups(result.groups);

        result.tree.print(std::cout);
        result.tree.print_merge_history(std::cout);
    }
}

} // namespace detail

int clumper_cluster(seqan3::argument_parser & parser)
{
    auto start = std::chrono::high_resolution_clock::now();

    cluster_config config{};
    initialize_argument_parser(parser, config);

    try
    {
        parser.parse();
    }
    catch (seqan3::argument_parser_error const & ext)
    {
        std::cerr << "[CLUMPER CLUSTER ERROR] " << ext.what() << '\n';
        return -1;
    }

    try
    {
        std::vector<item> const items = read_item_file(config.data_file);

        clustering_engine engine{config.verbose ? &std::cerr : nullptr};
        clustering_result result = engine.cluster(items, config.capacity);

        detail::write_outputs(config, result, items.size());
    }
    catch (std::invalid_argument const & err)
    {
        std::cerr << "[CLUMPER CLUSTER ERROR] " << err.what() << '\n';
        return -1;
    }
    catch (std::runtime_error const & err)
    {
        std::cerr << "[CLUMPER CLUSTER ERROR] " << err.what() << '\n';
        return -1;
    }

    if (config.verbose)
    {
        auto dur = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::high_resolution_clock::now() - start);
        std::cerr << "[CLUMPER] Took " << dur.count() << " seconds.\n";
        print_peak_memory_usage(std::cerr);
    }

    return 0;
}
