#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <clumper/cluster/clustering_engine.hpp>
#include <clumper/io/write_group_file.hpp>

TEST(write_group_file_test, small_example)
{
    clustering_result const result = clustering_engine{}.cluster({{"a", 50}, {"b", 55.5}, {"c", 10}}, 100);

    std::stringstream out;
    write_group_file(result.groups, out);

    std::string const expected
    {
        "#GROUP_ID\tITEM_IDS\tTOTAL_WEIGHT\n"
        "2\tb\t55.5\n"
        "4\ta;c\t60\n"
    };

    EXPECT_EQ(out.str(), expected);
}

TEST(write_group_file_test, no_groups)
{
    std::stringstream out;
    write_group_file({}, out);

    EXPECT_EQ(out.str(), "#GROUP_ID\tITEM_IDS\tTOTAL_WEIGHT\n");
}

TEST(write_merge_log_test, small_example)
{
    clustering_result const result = clustering_engine{}.cluster({{"f1", 40}, {"f2", 10}, {"f3", 50}}, 100);

    std::stringstream out;
    write_merge_log(result.merge_log(), out);

    std::string const expected
    {
        "#PARENT_A\tPARENT_B\tCHILD\tDISTANCE\n"
        "1\t3\t4\t10\n"
        "2\t4\t5\t30\n"
    };

    EXPECT_EQ(out.str(), expected);
}

TEST(write_group_file_test, weights_are_written_exactly)
{
    clustering_result const result = clustering_engine{}.cluster({{"big", 1234567.89}, {"frac", 12.3456789}}, 1e6);

    std::stringstream out;
    write_group_file(result.groups, out);

    std::string line;
    std::getline(out, line); // header

    std::vector<double> weights;
    while (std::getline(out, line))
        weights.push_back(std::stod(line.substr(line.rfind('\t') + 1)));

    ASSERT_EQ(weights.size(), 2u);
    EXPECT_EQ(weights[0], 1234567.89);
    EXPECT_EQ(weights[1], 12.3456789);
}

TEST(write_merge_log_test, distances_are_written_exactly)
{
    clustering_result const result = clustering_engine{}.cluster({{"a", 1000000.5}, {"b", 2.25}}, 2e6);

    std::stringstream out;
    write_merge_log(result.merge_log(), out);

    std::string line;
    std::getline(out, line); // header
    std::getline(out, line);

    EXPECT_EQ(std::stod(line.substr(line.rfind('\t') + 1)), 1000000.5 - 2.25);
}
