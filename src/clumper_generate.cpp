#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include <seqan3/argument_parser/all.hpp>

#include <clumper/generate/clumper_generate.hpp>
#include <clumper/generate/generate_config.hpp>
#include <clumper/item/item_generator.hpp>
#include <clumper/item/read_item_file.hpp>

void initialize_argument_parser(seqan3::argument_parser & parser, generate_config & config)
{
    parser.info.author = "clumper developers";
    parser.info.short_description = "Generate synthetic items for clumper cluster.";
    parser.info.version = "1.0.0";
    parser.info.examples.push_back("clumper generate -n 100 --min-weight 1 --max-weight 20 -o items.tsv");
    parser.info.examples.push_back("clumper generate --scenario small -o items.tsv");

    parser.add_option(config.output_filename, 'o', "output-filename", "The items are written to this file.");
    seqan3::arithmetic_range_validator positive_weight{std::numeric_limits<double>::min(),
                                                       std::numeric_limits<double>::max()};

    parser.add_option(config.num_items, 'n', "num-items", "The number of items with random weights.",
                      seqan3::option_spec::standard,
                      seqan3::arithmetic_range_validator{size_t{1}, std::numeric_limits<size_t>::max()});
    parser.add_option(config.min_weight, '\0', "min-weight", "The smallest random weight. Must be positive.",
                      seqan3::option_spec::standard, positive_weight);
    parser.add_option(config.max_weight, '\0', "max-weight", "The largest random weight.",
                      seqan3::option_spec::standard, positive_weight);
    parser.add_option(config.seed, 's', "seed", "The seed of the random number generator.");
    parser.add_option(config.prefix, '\0', "prefix", "Random items are named <prefix>_0001.dat, ...");
    parser.add_option(config.scenario, '\0', "scenario",
                      "Generate a predefined set of items with fixed weights instead of random ones.",
                      seqan3::option_spec::standard,
                      seqan3::value_list_validator{"mixed", "small", "medium", "large"});
}

int clumper_generate(seqan3::argument_parser & parser)
{
    generate_config config{};
    initialize_argument_parser(parser, config);

    try
    {
        parser.parse();
    }
    catch (seqan3::argument_parser_error const & ext)
    {
        std::cerr << "[CLUMPER GENERATE ERROR] " << ext.what() << '\n';
        return -1;
    }

    try
    {
        item_generator generator{config.min_weight, config.max_weight, config.seed};

        std::vector<item> const items = config.scenario.empty() ? generator.generate(config.num_items, config.prefix)
                                                                : generator.generate_scenario(config.scenario);

        std::ofstream fout{config.output_filename};
        if (!fout.good())
            throw std::runtime_error{"Could not open " + config.output_filename.string() + " for writing."};

        write_item_file(items, fout);
    }
    catch (std::invalid_argument const & err)
    {
        std::cerr << "[CLUMPER GENERATE ERROR] " << err.what() << '\n';
        return -1;
    }
    catch (std::runtime_error const & err)
    {
        std::cerr << "[CLUMPER GENERATE ERROR] " << err.what() << '\n';
        return -1;
    }

    return 0;
}
