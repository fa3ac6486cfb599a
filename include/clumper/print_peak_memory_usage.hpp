#pragma once

#include <ostream>
#include <sys/time.h>
#include <sys/resource.h>

//!\brief Report the peak resident set size of this process.
inline void print_peak_memory_usage(std::ostream & out)
{
    rusage usage;

    if (getrusage(RUSAGE_SELF, &usage) == 0)
        out << "[CLUMPER] peak memory usage: " << usage.ru_maxrss << " kilobytes\n";
    else
        out << "[CLUMPER] couldn't determine peak memory usage\n";
}
