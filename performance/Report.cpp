#include "pch.hpp"
#include "Report.hpp"

namespace RankSort
{
    void PrintArray(std::ostream& out, const char* title, const std::vector<data_t>& values)
    {
        out << title << '\n';
        for (auto value : values)
        {
            out << value << ' ';
        }
        out << "\n\n";
    }

    void PrintDuration(std::ostream& out, const char* title, std::chrono::nanoseconds duration)
    {
        out << boost::format("%1% execution duration (ns): %2%\n") % title % duration.count();
    }
}
