#pragma once

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>

//!\brief Memory a storage system spends on metadata, before and after items were merged into groups.
struct footprint_report
{
    size_t items{};
    size_t groups{};
    size_t entry_bytes{};
    size_t original_bytes{};
    size_t merged_bytes{};
    size_t saved_bytes{};
    // rounded to two decimals
    double reduction_percentage{};
};

/*!\brief Estimates the metadata memory of a storage system that keeps one fixed size entry per stored file.
 *
 * Before merging every item needs an entry, afterwards only every group does.
 */
class metadata_footprint
{
private:
    size_t entry_bytes;

public:
    //!\brief 150 bytes per entry is the commonly cited HDFS NameNode figure.
    static constexpr size_t default_entry_bytes{150};

    explicit metadata_footprint(size_t const entry_bytes_ = default_entry_bytes) :
        entry_bytes{entry_bytes_}
    {}

    footprint_report compare(size_t const num_items, size_t const num_groups) const
    {
        footprint_report report{};
        report.items = num_items;
        report.groups = num_groups;
        report.entry_bytes = entry_bytes;
        report.original_bytes = num_items * entry_bytes;
        report.merged_bytes = num_groups * entry_bytes;
        report.saved_bytes = report.original_bytes > report.merged_bytes ? report.original_bytes - report.merged_bytes
                                                                         : 0;

        if (report.original_bytes > 0)
        {
            double const percentage = 100.0 * report.saved_bytes / report.original_bytes;
            report.reduction_percentage = std::round(percentage * 100.0) / 100.0;
        }

        return report;
    }

    //!\brief "N bytes" below 1 KiB, "x.xx KB" below 1 MiB and "x.xx MB" otherwise.
    static std::string format_bytes(size_t const bytes)
    {
        std::stringstream ss;

        if (bytes < 1024)
            ss << bytes << " bytes";
        else if (bytes < 1024 * 1024)
            ss << std::fixed << std::setprecision(2) << bytes / 1024.0 << " KB";
        else
            ss << std::fixed << std::setprecision(2) << bytes / (1024.0 * 1024.0) << " MB";

        return ss.str();
    }
};
