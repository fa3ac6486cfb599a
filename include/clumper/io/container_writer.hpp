#pragma once

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <seqan3/std/filesystem>

#include <clumper/cluster/group.hpp>
#include <clumper/io/container_layout.hpp>

//!\brief Concatenates the (simulated) content of the items of every group into one container file per group.
class container_writer
{
private:
    std::filesystem::path output_dir;
    size_t bytes_per_unit;

public:
    /*!\brief A writer that puts its containers into output_dir. The directory is created if needed.
     * \param[in] output_dir_ directory for the group_<id>.bin files
     * \param[in] bytes_per_unit_ how many bytes one unit of item weight corresponds to
     */
    container_writer(std::filesystem::path output_dir_, size_t const bytes_per_unit_) :
        output_dir{std::move(output_dir_)},
        bytes_per_unit{bytes_per_unit_}
    {
        if (!std::filesystem::exists(output_dir))
            std::filesystem::create_directories(output_dir);
    }

    //!\brief Write the container of one group and return its path.
    std::filesystem::path write(group const & g) const
    {
        std::filesystem::path const path = output_dir / container_filename(g.id());
        std::ofstream fout{path, std::ios::binary};

        if (!fout.good())
            throw std::runtime_error{"Could not open container " + path.string() + " for writing."};

        std::string const filler(1024, 'X');

        for (auto const & i : g.items())
        {
            std::string const header = container_item_header(i);
            fout << header;

            size_t remaining = container_item_size(i, bytes_per_unit) - header.size();
            while (remaining > 0)
            {
                size_t const chunk = std::min(remaining, filler.size());
                fout.write(filler.data(), static_cast<std::streamsize>(chunk));
                remaining -= chunk;
            }
        }

        if (!fout.good())
            throw std::runtime_error{"Writing container " + path.string() + " failed."};

        return path;
    }

    //!\brief Write the containers of all groups in the given order.
    std::vector<std::filesystem::path> write_all(std::vector<group> const & groups) const
    {
        std::vector<std::filesystem::path> paths;
        paths.reserve(groups.size());

        for (auto const & g : groups)
            paths.push_back(write(g));

        return paths;
    }
};
