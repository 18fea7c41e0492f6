#pragma once
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "sort_types.hpp"

namespace RankSort
{
    struct SortOptions
    {
        data_t maxValue = 0; // generated values are in [0, maxValue)
        std::size_t arraySize = 0;
        bool maxValueGiven = false;
        bool arraySizeGiven = false;

        DeviceKind device = DeviceKind::Gpu;

        unsigned seed = 0;
        bool seedGiven = false;

        bool printArrays = true;
        bool verify = true;
        int verbosity = 0;
    };

    // Command line first, then the file named by --config for anything not given.
    // Returns nullopt when --help was requested. Bad values throw
    // boost::program_options::error.
    std::optional<SortOptions> ParseCommandLine(int argc, const char* const argv[]);

    std::string Usage();

    DeviceKind ParseDeviceKind(const std::string& name);

    // asks for the sort bound and the array size when the command line did not set them
    void PromptForMissing(SortOptions& options, std::istream& in, std::ostream& out);

    // count uniformly distributed values in [0, maxValue)
    std::vector<data_t> GenerateInput(std::size_t count, data_t maxValue, unsigned seed);
}
