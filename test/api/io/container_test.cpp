#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <seqan3/test/tmp_filename.hpp>

#include <clumper/cluster/clustering_engine.hpp>
#include <clumper/io/container_index.hpp>
#include <clumper/io/container_writer.hpp>

namespace
{

std::string read_file(std::filesystem::path const & path)
{
    std::ifstream fin{path, std::ios::binary};
    return std::string{std::istreambuf_iterator<char>{fin}, std::istreambuf_iterator<char>{}};
}

} // namespace

TEST(container_layout_test, item_size)
{
    // header "ITEM: a\n" has 8 bytes
    EXPECT_EQ(container_item_size(item{"a", 3}, 10), 30u);
    EXPECT_EQ(container_item_size(item{"a", 0.25}, 10), 8u);
    EXPECT_EQ(container_item_size(item{"long_name", 0.1}, 10), 16u);
    EXPECT_EQ(container_filename(12), "group_12.bin");
}

TEST(container_layout_test, item_too_large_for_a_container)
{
    item const huge{"huge", 1e14};

    // 1e14 units at 1 MiB per unit are more than 2^64 bytes
    EXPECT_THROW(container_item_size(huge, 1024 * 1024), std::invalid_argument);

    try
    {
        container_item_size(huge, 1024 * 1024);
    }
    catch (std::invalid_argument const & err)
    {
        EXPECT_NE(std::string{err.what()}.find("huge"), std::string::npos) << err.what();
    }

    // still fine at one byte per unit
    EXPECT_EQ(container_item_size(huge, 1), 100000000000000u);
}

TEST(container_test, index_rejects_items_too_large_for_a_container)
{
    group_id_counter ids;
    std::vector<group> const groups{group{item{"small", 1}, ids}, group{item{"huge", 1e14}, ids}};

    EXPECT_THROW((container_index{groups, 1024 * 1024}), std::invalid_argument);
}

TEST(container_test, write_and_index)
{
    seqan3::test::tmp_filename container_dir{"containers"};

    // a and b are merged into group 4, z stays alone as group 2
    clustering_result const result = clustering_engine{}.cluster({{"a", 3}, {"z", 9}, {"b", 1}}, 5);
    ASSERT_EQ(result.groups.size(), 2u);

    container_writer const writer{container_dir.get_path(), 10};
    std::vector<std::filesystem::path> const paths = writer.write_all(result.groups);

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0].filename(), "group_2.bin");
    EXPECT_EQ(paths[1].filename(), "group_4.bin");

    std::string const group_4 = read_file(paths[1]);
    EXPECT_EQ(group_4, "ITEM: a\n" + std::string(22, 'X') + "ITEM: b\n" + std::string(2, 'X'));
    EXPECT_EQ(std::filesystem::file_size(paths[0]), 90u);

    container_index const index{result.groups, 10};

    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.locate("a"), (item_location{4, 0, 30}));
    EXPECT_EQ(index.locate("b"), (item_location{4, 30, 10}));
    EXPECT_EQ(index.locate("z"), (item_location{2, 0, 90}));
    EXPECT_EQ(index.locate("unknown"), std::nullopt);

    EXPECT_EQ(index.items_in_group(4), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(index.items_in_group(42).empty());

    EXPECT_EQ(index.extract("b", container_dir.get_path()), "ITEM: b\nXX");
    EXPECT_EQ(index.extract("unknown", container_dir.get_path()), std::nullopt);
}

TEST(container_test, missing_container)
{
    seqan3::test::tmp_filename container_dir{"no_containers"};

    clustering_result const result = clustering_engine{}.cluster({{"a", 1}}, 5);
    container_index const index{result.groups, 10};

    EXPECT_THROW(index.extract("a", container_dir.get_path()), std::runtime_error);
}
