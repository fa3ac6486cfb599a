#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <clumper/item/item.hpp>

TEST(item_test, construction)
{
    item const i{"file_0001.dat", 12.5};

    EXPECT_EQ(i.id(), "file_0001.dat");
    EXPECT_EQ(i.weight(), 12.5);
}

TEST(item_test, non_positive_weight)
{
    EXPECT_THROW((item{"zero", 0.0}), std::invalid_argument);
    EXPECT_THROW((item{"negative", -1.0}), std::invalid_argument);
    EXPECT_THROW((item{"nan", std::numeric_limits<double>::quiet_NaN()}), std::invalid_argument);
    EXPECT_THROW((item{"inf", std::numeric_limits<double>::infinity()}), std::invalid_argument);
}

TEST(item_test, error_names_the_item)
{
    try
    {
        item{"broken.bin", -2.0};
        FAIL() << "expected std::invalid_argument";
    }
    catch (std::invalid_argument const & err)
    {
        std::string const message{err.what()};
        EXPECT_NE(message.find("broken.bin"), std::string::npos);
        EXPECT_NE(message.find("-2"), std::string::npos);
    }
}

TEST(item_test, tiny_weight_is_valid)
{
    EXPECT_NO_THROW((item{"tiny", 1e-9}));
}
