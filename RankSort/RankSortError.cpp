#include "pch.hpp"
#include "RankSortError.hpp"

namespace RankSort
{
    namespace
    {
        std::string format_message(RankSortError::Stage stage, int errorCode, const std::string& message)
        {
            auto text = boost::format("%1% failed: %2%") % ToString(stage) % message;
            if (errorCode != 0)
            {
                text = boost::format("%1% (error %2%)") % text.str() % errorCode;
            }
            return text.str();
        }
    }

    RankSortError::RankSortError(Stage stage, int errorCode, const std::string& message)
        :
        std::runtime_error(format_message(stage, errorCode, message)),
        _stage(stage),
        _errorCode(errorCode)
    {
    }

    const char* ToString(RankSortError::Stage stage)
    {
        using Stage = RankSortError::Stage;
        switch (stage)
        {
        case Stage::DeviceDiscovery: return "device discovery";
        case Stage::DeviceQuery: return "device query";
        case Stage::ContextCreation: return "context creation";
        case Stage::Build: return "kernel build";
        case Stage::Allocation: return "buffer allocation";
        case Stage::Upload: return "buffer upload";
        case Stage::CountLaunch: return "rank count launch";
        case Stage::ScatterLaunch: return "rank scatter launch";
        case Stage::Download: return "buffer download";
        case Stage::Synchronization: return "synchronization";
        case Stage::Profiling: return "profiling";
        }
        return "unknown stage";
    }
}
