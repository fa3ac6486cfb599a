#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "cli_test.hpp"

TEST_F(cli_test, small_example)
{
    cli_test_result result = execute_app("clumper", "cluster",
                                         "-f", data("items.tsv").string(),
                                         "-c", "100",
                                         "-o", "groups.tsv",
                                         "-m", "merges.tsv");

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, std::string{});
    EXPECT_EQ(result.err, std::string{});

    std::string const expected_groups
    {
        "#GROUP_ID\tITEM_IDS\tTOTAL_WEIGHT\n"
        "5\tf2;f1;f3\t100\n"
    };

    std::string const expected_merges
    {
        "#PARENT_A\tPARENT_B\tCHILD\tDISTANCE\n"
        "1\t3\t4\t10\n"
        "2\t4\t5\t30\n"
    };

    EXPECT_EQ(read_file("groups.tsv"), expected_groups);
    EXPECT_EQ(read_file("merges.tsv"), expected_merges);
}

TEST_F(cli_test, print_full_history)
{
    cli_test_result result = execute_app("clumper", "cluster",
                                         "-f", data("items.tsv").string(),
                                         "-c", "100",
                                         "--print-tree",
                                         "--full-history");

    std::string const expected_stdout
    {
        "Tree 1 (group 5):\n"
        "└── group 5 (100.0) [distance=30.0]\n"
        "    ├── group 2 (10.0) [f2]\n"
        "    └── group 4 (90.0) [distance=10.0]\n"
        "        ├── group 1 (40.0) [f1]\n"
        "        └── group 3 (50.0) [f3]\n"
        "\n"
        "Merge 1: group 1 + group 3 -> group 4 (distance: 10.00)\n"
        "Merge 2: group 2 + group 4 -> group 5 (distance: 30.00)\n"
    };

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, expected_stdout);
    EXPECT_EQ(result.err, std::string{});
}

TEST_F(cli_test, report_and_containers)
{
    cli_test_result result = execute_app("clumper", "cluster",
                                         "-f", data("mixed.tsv").string(),
                                         "-c", "128",
                                         "-r", "report.txt",
                                         "-d", "containers",
                                         "-b", "4",
                                         "-v");

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, std::string{});
    EXPECT_NE(result.err.find("[CLUMPER] Clustering 15 items"), std::string::npos) << result.err;
    EXPECT_NE(result.err.find("peak memory usage"), std::string::npos) << result.err;

    std::string const report = read_file("report.txt");
    EXPECT_NE(report.find("Input items: 15\n"), std::string::npos) << report;

    // the containers hold every item exactly once
    size_t total_bytes{0};
    for (auto const & entry : std::filesystem::directory_iterator{"containers"})
        total_bytes += std::filesystem::file_size(entry.path());
    // 280 weight units at 4 bytes each, config.xml and script.py are padded up to their header size
    EXPECT_EQ(total_bytes, 1133u);
}

TEST_F(cli_test, invalid_capacity)
{
    cli_test_result result = execute_app("clumper", "cluster",
                                         "-f", data("items.tsv").string(),
                                         "-c", "0");

    EXPECT_NE(result.exit_code, 0);
    EXPECT_EQ(result.out, std::string{});
    EXPECT_NE(result.err.find("[CLUMPER CLUSTER ERROR]"), std::string::npos) << result.err;
    EXPECT_NE(result.err.find("capacity"), std::string::npos) << result.err;
    EXPECT_FALSE(std::filesystem::exists("groups.tsv"));
}

TEST_F(cli_test, invalid_bytes_per_unit)
{
    cli_test_result result = execute_app("clumper", "cluster",
                                         "-f", data("items.tsv").string(),
                                         "-b", "0");

    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.err.find("bytes-per-unit"), std::string::npos) << result.err;
}

TEST_F(cli_test, invalid_weight)
{
    cli_test_result result = execute_app("clumper", "cluster",
                                         "-f", data("bad_weight.tsv").string(),
                                         "-o", "groups.tsv");

    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.err.find("Line 3"), std::string::npos) << result.err;
    EXPECT_FALSE(std::filesystem::exists("groups.tsv"));
}

TEST_F(cli_test, missing_input_file_option)
{
    cli_test_result result = execute_app("clumper", "cluster", "-c", "10");

    EXPECT_NE(result.exit_code, 0);
    EXPECT_NE(result.err.find("[CLUMPER CLUSTER ERROR]"), std::string::npos) << result.err;
}

TEST_F(cli_test, metadata_files)
{
    cli_test_result result = execute_app("clumper", "cluster",
                                         "-f", data("items.tsv").string(),
                                         "-c", "60",
                                         "-j", "metadata");

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.err, std::string{});

    // f1 and f2 are merged into group 4, f3 stays alone as group 3
    std::ifstream summary_file{"metadata/groups_summary.json"};
    nlohmann::json const summary = nlohmann::json::parse(summary_file);

    EXPECT_EQ(summary.at("total_groups"), 2);
    EXPECT_EQ(summary.at("summary").at("total_items"), 3);
    EXPECT_TRUE(std::filesystem::exists("metadata/group_3_metadata.json"));
    EXPECT_TRUE(std::filesystem::exists("metadata/group_4_metadata.json"));
}

TEST_F(cli_test, input_path_with_spaces)
{
    std::filesystem::copy_file(data("items.tsv"), "my items.tsv");

    cli_test_result result = execute_app("clumper", "cluster", "-f", "my items.tsv", "-c", "100",
                                         "-o", "my groups.tsv");

    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(read_file("my groups.tsv"), "#GROUP_ID\tITEM_IDS\tTOTAL_WEIGHT\n5\tf2;f1;f3\t100\n");
}
