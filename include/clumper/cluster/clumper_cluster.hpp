#pragma once

#include <seqan3/argument_parser/all.hpp>

#include <clumper/cluster/cluster_config.hpp>

//!\brief Register the options of `clumper cluster` with the parser.
void initialize_argument_parser(seqan3::argument_parser & parser, cluster_config & config);

//!\brief Run `clumper cluster`. Returns the exit code.
int clumper_cluster(seqan3::argument_parser & parser);
