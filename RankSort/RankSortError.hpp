#pragma once
#include <stdexcept>
#include <string>

namespace RankSort
{
    // thrown when an accelerator stage fails, the stage tells where
    class RankSortError : public std::runtime_error
    {
    public:
        enum class Stage
        {
            DeviceDiscovery,
            DeviceQuery,
            ContextCreation,
            Build,
            Allocation,
            Upload,
            CountLaunch,
            ScatterLaunch,
            Download,
            Synchronization,
            Profiling
        };

        RankSortError(Stage stage, int errorCode, const std::string& message);

        Stage GetStage() const noexcept { return _stage; }

        // OpenCL status code, 0 if the failure did not come from the runtime
        int ErrorCode() const noexcept { return _errorCode; }

    private:
        Stage _stage;
        int _errorCode;
    };

    const char* ToString(RankSortError::Stage stage);
}
