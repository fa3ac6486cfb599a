#pragma once

#include <cstddef>

#include <seqan3/std/filesystem>

#include <clumper/io/metadata_footprint.hpp>

struct cluster_config
{
    std::filesystem::path data_file;
    std::filesystem::path output_filename{"groups.tsv"};
    std::filesystem::path merge_log_filename{};
    std::filesystem::path report_filename{};
    std::filesystem::path container_dir{};
    std::filesystem::path metadata_dir{};
    double capacity{128.0};
    size_t bytes_per_unit{1024 * 1024};
    size_t entry_bytes{metadata_footprint::default_entry_bytes};
    bool full_history{false};
    bool print_tree{false};
    bool verbose{false};
};
