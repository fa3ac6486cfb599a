#pragma once

#include <seqan3/argument_parser/all.hpp>

#include <clumper/generate/generate_config.hpp>

void initialize_argument_parser(seqan3::argument_parser & parser, generate_config & config);

//!\brief Run `clumper generate`. Returns the exit code.
int clumper_generate(seqan3::argument_parser & parser);
