#include <iostream>
#include <string_view>

#include <seqan3/argument_parser/all.hpp>

#include <clumper/cluster/clumper_cluster.hpp>
#include <clumper/generate/clumper_generate.hpp>

int main(int argc, const char *argv [])
{
    seqan3::argument_parser top_level_parser{"clumper", argc, argv, seqan3::update_notifications::off,
                                             {"cluster", "generate"}};
    top_level_parser.info.version = "1.0.0";
    top_level_parser.info.short_description = "Merge many small items into few capacity bounded groups.";

    try
    {
        top_level_parser.parse();
    }
    catch (seqan3::argument_parser_error const & ext)
    {
        std::cerr << "[CLUMPER ERROR] " << ext.what() << '\n';
        return -1;
    }

    seqan3::argument_parser & sub_parser = top_level_parser.get_sub_parser();

    if (sub_parser.info.app_name == std::string_view{"clumper-cluster"})
        return clumper_cluster(sub_parser);
    if (sub_parser.info.app_name == std::string_view{"clumper-generate"})
        return clumper_generate(sub_parser);

    std::cerr << "[CLUMPER ERROR] Unknown subcommand " << sub_parser.info.app_name << '\n';
    return -1;
}
