#pragma once

#include <fstream>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <seqan3/std/filesystem>

#include <clumper/item/item.hpp>

namespace detail
{

inline std::runtime_error item_file_error(std::filesystem::path const & path, size_t const line_number,
                                          std::string const & what)
{
    std::stringstream ss;
    ss << "Line " << line_number << " of " << path.string() << ": " << what;
    return std::runtime_error{ss.str()};
}

} // namespace detail

/*!\brief Read the items from a tab separated file.
 *
 * Every line contains an item id and its weight, separated by a tab. Empty lines and lines starting with '#'
 * are skipped. The items are returned in file order.
 *
 * \param[in] path the file to read
 * \throws std::runtime_error if the file cannot be opened or a line is malformed,
 *         e.g. the weight is missing, unparsable or not positive
 */
inline std::vector<item> read_item_file(std::filesystem::path const & path)
{
    std::ifstream fin{path};

    if (!fin.good() || !fin.is_open())
        throw std::runtime_error{"Could not open item file " + path.string() + " for reading."};

    std::vector<item> items;
    std::string line;
    size_t line_number{0};

    while (std::getline(fin, line))
    {
        ++line_number;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (line.empty() || line[0] == '#')
            continue;

        size_t const tab = line.find('\t');
        if (tab == std::string::npos)
            throw detail::item_file_error(path, line_number, "expected '<id>\\t<weight>' but found no tab.");

        std::string id = line.substr(0, tab);
        std::string const weight_str = line.substr(tab + 1);

        if (id.empty())
            throw detail::item_file_error(path, line_number, "the item id is empty.");

        double weight{};
        size_t parsed{0};
        try
        {
            weight = std::stod(weight_str, &parsed);
        }
        catch (std::invalid_argument const &)
        {
            throw detail::item_file_error(path, line_number, "'" + weight_str + "' is not a number.");
        }
        catch (std::out_of_range const &)
        {
            throw detail::item_file_error(path, line_number, "'" + weight_str + "' is out of range.");
        }

        if (parsed != weight_str.size())
            throw detail::item_file_error(path, line_number, "unexpected characters after the weight '"
                                                             + weight_str + "'.");

        try
        {
            items.emplace_back(std::move(id), weight);
        }
        catch (std::invalid_argument const & err)
        {
            throw detail::item_file_error(path, line_number, err.what());
        }
    }

    return items;
}

/*!\brief Write items in the format read_item_file() understands.
 * \param[in] items the items to write
 * \param[in] out the stream to write to
 *
 * Weights are written with enough digits to be read back exactly.
 */
inline void write_item_file(std::vector<item> const & items, std::ostream & out)
{
    std::streamsize const precision = out.precision(std::numeric_limits<double>::max_digits10);

    out << "#ID\tWEIGHT\n";
    for (auto const & i : items)
        out << i.id() << '\t' << i.weight() << '\n';

    out.precision(precision);
}
