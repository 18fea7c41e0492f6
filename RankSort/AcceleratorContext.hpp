#pragma once
#include <string>
#include <string_view>
#include <boost/compute/core.hpp>
#include "sort_types.hpp"

namespace RankSort
{
    // Device, context, profiling queue and the two compiled rank sort kernels.
    // Built once by the caller and handed to the sorters, nothing here is global.
    class AcceleratorContext
    {
    public:
        // picks the first device of the requested kind over all platforms
        static AcceleratorContext Create(DeviceKind kind);

        explicit AcceleratorContext(const boost::compute::device& device);

        const boost::compute::device& Device() const { return _device; }
        const boost::compute::context& Context() const { return _context; }
        boost::compute::command_queue& Queue() { return _queue; }

        boost::compute::kernel& CountKernel() { return _countKernel; }
        boost::compute::kernel& ScatterKernel() { return _scatterKernel; }

        // multi line capability report of the selected device
        std::string Describe() const;

        // builds source with KernelBuildOptions(), a failed build throws with the build log attached
        static boost::compute::program BuildProgram(const boost::compute::context& context, std::string_view source);

        static std::string KernelBuildOptions();
        static std::string_view KernelSource();

    private:
        boost::compute::device _device;
        boost::compute::context _context;
        boost::compute::command_queue _queue;

        boost::compute::kernel _countKernel;
        boost::compute::kernel _scatterKernel;
    };
}
