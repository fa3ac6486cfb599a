#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <clumper/item/item.hpp>

//!\brief Generates synthetic items, e.g. to simulate a directory full of small files.
class item_generator
{
private:
    double min_weight;
    double max_weight;
    std::mt19937_64 engine;

    static std::string item_name(std::string const & prefix, size_t const number)
    {
        std::stringstream ss;
        ss << prefix << '_' << std::setw(4) << std::setfill('0') << number << ".dat";
        return ss.str();
    }

public:
    //!\brief A list of (weight, count) pairs.
    using distribution = std::vector<std::pair<double, size_t>>;

    /*!\brief A generator for items with random weights.
     * \param[in] min_weight_ the smallest weight generate() produces, must be > 0
     * \param[in] max_weight_ the largest weight generate() produces, must be >= min_weight_
     * \param[in] seed the seed of the random number engine
     *
     * \throws std::invalid_argument if the weight range is invalid
     */
    item_generator(double const min_weight_, double const max_weight_, uint64_t const seed) :
        min_weight{min_weight_},
        max_weight{max_weight_},
        engine{seed}
    {
        if (!(min_weight > 0) || !(min_weight <= max_weight))
        {
            std::stringstream ss;
            ss << "The weight range [" << min_weight << ", " << max_weight << "] is invalid. "
               << "The minimum must be positive and must not exceed the maximum.";
            throw std::invalid_argument{ss.str()};
        }
    }

    /*!\brief Generate items with weights drawn uniformly from [min_weight, max_weight].
     *
     * The weights are rounded to two decimals. The items are named <prefix>_0001.dat, <prefix>_0002.dat, ...
     */
    std::vector<item> generate(size_t const num_items, std::string const & prefix = "item")
    {
        std::uniform_real_distribution<double> weight_distribution{min_weight, max_weight};

        std::vector<item> items;
        items.reserve(num_items);

        for (size_t i = 1; i <= num_items; ++i)
        {
            double const weight = std::max(std::round(weight_distribution(engine) * 100.0) / 100.0, 0.01);
            items.emplace_back(item_name(prefix, i), weight);
        }

        return items;
    }

    /*!\brief Generate items with fixed weights.
     * \param[in] weights_and_counts the weights and how many items of each weight are generated, in that order
     */
    std::vector<item> generate_with_distribution(distribution const & weights_and_counts) const
    {
        std::vector<item> items;
        size_t number{1};

        for (auto const & [weight, count] : weights_and_counts)
            for (size_t i = 0; i < count; ++i)
                items.emplace_back(item_name("item", number++), weight);

        return items;
    }

    /*!\brief Generate one of the predefined scenarios: "mixed", "small", "medium" or "large".
     *
     * Unknown names fall back to "mixed".
     */
    std::vector<item> generate_scenario(std::string const & name) const
    {
        if (name == "small")
            return generate_with_distribution({{2, 20}, {5, 15}, {8, 10}, {12, 5}});
        else if (name == "medium")
            return generate_with_distribution({{15, 10}, {20, 10}, {25, 8}, {30, 6}});
        else if (name == "large")
            return generate_with_distribution({{30, 8}, {40, 6}, {50, 4}});

        return generate_with_distribution({{5, 15}, {10, 12}, {20, 8}, {35, 5}, {45, 3}});
    }
};
