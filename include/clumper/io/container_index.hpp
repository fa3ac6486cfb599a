#pragma once

#include <cstddef>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <seqan3/std/filesystem>

#include <clumper/cluster/group.hpp>
#include <clumper/io/container_layout.hpp>

#include <robin_hood.h>

//!\brief Where an item lives inside the container of its group.
struct item_location
{
    size_t group_id;
    size_t offset;
    size_t size;

    bool operator==(item_location const & other) const = default;
};

/*!\brief Maps item ids to their location in the group containers written by container_writer.
 *
 * If an id occurs more than once, the last occurrence is indexed.
 */
class container_index
{
private:
    robin_hood::unordered_map<std::string, item_location> locations;
    robin_hood::unordered_map<size_t, std::vector<std::string>> members;

public:
    /*!\brief Index the items of the given groups.
     * \param[in] groups the final groups
     * \param[in] bytes_per_unit must be the value the containers were written with
     *
     * \throws std::invalid_argument if an item or a container is too large to be addressed
     */
    container_index(std::vector<group> const & groups, size_t const bytes_per_unit)
    {
        for (auto const & g : groups)
        {
            size_t offset{0};
            std::vector<std::string> & ids = members[g.id()];

            for (auto const & i : g.items())
            {
                size_t const size = container_item_size(i, bytes_per_unit);

                if (size > std::numeric_limits<size_t>::max() - offset)
                    throw std::invalid_argument{"The container of group " + std::to_string(g.id())
                                                + " is too large to be addressed."};

                locations[i.id()] = item_location{g.id(), offset, size};
                ids.push_back(i.id());
                offset += size;
            }
        }
    }

    std::optional<item_location> locate(std::string const & id) const
    {
        auto it = locations.find(id);
        if (it == locations.end())
            return std::nullopt;
        return it->second;
    }

    //!\brief The ids of the items in the given group in concatenation order, empty for unknown groups.
    std::vector<std::string> items_in_group(size_t const group_id) const
    {
        auto it = members.find(group_id);
        if (it == members.end())
            return {};
        return it->second;
    }

    /*!\brief Read the bytes of an item back from its container.
     * \param[in] id the item id
     * \param[in] container_dir the directory the containers were written to
     * \returns the bytes of the item (header included) or std::nullopt if the id is not indexed
     *
     * \throws std::runtime_error if the container cannot be read
     */
    std::optional<std::string> extract(std::string const & id, std::filesystem::path const & container_dir) const
    {
        std::optional<item_location> const location = locate(id);
        if (!location)
            return std::nullopt;

        std::filesystem::path const path = container_dir / container_filename(location->group_id);
        std::ifstream fin{path, std::ios::binary};

        if (!fin.good())
            throw std::runtime_error{"Could not open container " + path.string() + " for reading."};

        std::string content(location->size, '\0');
        fin.seekg(static_cast<std::streamoff>(location->offset));
        fin.read(content.data(), static_cast<std::streamsize>(location->size));

        if (fin.gcount() != static_cast<std::streamsize>(location->size))
            throw std::runtime_error{"Container " + path.string() + " is shorter than its index says."};

        return content;
    }

    //!\brief Number of indexed item ids.
    size_t size() const noexcept
    {
        return locations.size();
    }
};
