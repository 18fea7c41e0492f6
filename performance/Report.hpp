#pragma once
#include <chrono>
#include <iosfwd>
#include <vector>
#include "../RankSort/sort_types.hpp"

namespace RankSort
{
    void PrintArray(std::ostream& out, const char* title, const std::vector<data_t>& values);

    void PrintDuration(std::ostream& out, const char* title, std::chrono::nanoseconds duration);
}
