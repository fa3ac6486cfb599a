#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <seqan3/std/filesystem>

struct generate_config
{
    std::filesystem::path output_filename{"items.tsv"};
    size_t num_items{30};
    double min_weight{0.5};
    double max_weight{50.0};
    uint64_t seed{42};
    // empty means uniformly random weights
    std::string scenario{};
    std::string prefix{"item"};
};
