#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include <clumper/item/item.hpp>

/* Layout of a group container:
 * the items are concatenated in group order, every item is a header line "ITEM: <id>\n" followed by
 * filler bytes. An item occupies max(header size, floor(weight * bytes_per_unit)) bytes.
 */

inline std::string container_item_header(item const & i)
{
    return "ITEM: " + i.id() + '\n';
}

/*!\brief The number of bytes an item occupies in its container.
 * \throws std::invalid_argument if the size does not fit into size_t
 */
inline size_t container_item_size(item const & i, size_t const bytes_per_unit)
{
    double const payload = std::floor(i.weight() * static_cast<double>(bytes_per_unit));

    // the maximum converts to 2^64, every smaller double fits into size_t
    if (!(payload < static_cast<double>(std::numeric_limits<size_t>::max())))
    {
        std::stringstream ss;
        ss << "The item '" << i.id() << "' with weight " << i.weight() << " needs " << payload
           << " bytes at " << bytes_per_unit << " bytes per unit, which exceeds the maximal container size.";
        throw std::invalid_argument{ss.str()};
    }

    return std::max(container_item_header(i).size(), static_cast<size_t>(payload));
}

inline std::string container_filename(size_t const group_id)
{
    return "group_" + std::to_string(group_id) + ".bin";
}
