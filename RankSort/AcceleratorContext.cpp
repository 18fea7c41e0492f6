#include "pch.hpp"
#include "AcceleratorContext.hpp"
#include "RankSortError.hpp"

inline const std::string_view RANK_SORT_KERNEL_STRING =
#include "rank_sort.cl"
"";

inline constexpr const char* COUNT_KERNEL_NAME = "rank_count";
inline constexpr const char* SCATTER_KERNEL_NAME = "rank_scatter";

namespace bc = boost::compute;

namespace RankSort
{
    namespace
    {
        const char* device_type_text(cl_device_type type)
        {
            if (type & CL_DEVICE_TYPE_GPU) return "GPU";
            if (type & CL_DEVICE_TYPE_CPU) return "CPU";
            if (type & CL_DEVICE_TYPE_ACCELERATOR) return "ACCELERATOR";
            return "OTHER";
        }

        // PCI vendor ids of the common OpenCL vendors
        const char* vendor_id_text(bc::uint_ vendorId)
        {
            switch (vendorId)
            {
            case 0x1002: return "AMD";
            case 0x10DE: return "NVIDIA";
            case 0x8086: return "Intel";
            case 0x1010: return "ImgTec";
            case 0x13B5: return "ARM";
            case 0x5143: return "Qualcomm";
            case 0x1E0F: return "Broadcom";
            default: return "unknown";
            }
        }

        std::string svm_capabilities_text(const bc::device& device)
        {
            if (!device.check_version(2, 0))
            {
                return "not supported";
            }
            auto capabilities = device.get_info<cl_device_svm_capabilities>(CL_DEVICE_SVM_CAPABILITIES);
            return (boost::format("%1$X") % capabilities).str();
        }

        std::string built_in_kernels_text(const bc::device& device)
        {
            if (!device.check_version(1, 2))
            {
                return "not supported";
            }
            return device.get_info<std::string>(CL_DEVICE_BUILT_IN_KERNELS);
        }

        bool matches(const bc::device& device, DeviceKind kind)
        {
            switch (kind)
            {
            case DeviceKind::Cpu: return (device.type() & CL_DEVICE_TYPE_CPU) != 0;
            case DeviceKind::Gpu:
            case DeviceKind::Any: return (device.type() & CL_DEVICE_TYPE_GPU) != 0;
            }
            return false;
        }
    }

    AcceleratorContext AcceleratorContext::Create(DeviceKind kind)
    {
        std::vector<bc::device> devices;
        try
        {
            devices = bc::system::devices();
            auto found = std::find_if(devices.begin(), devices.end(), [=](const bc::device& device) { return matches(device, kind); });
            if (found != devices.end())
            {
                return AcceleratorContext(*found);
            }
        }
        catch (const bc::opencl_error& e)
        {
            throw RankSortError(RankSortError::Stage::DeviceDiscovery, e.error_code(), e.error_string());
        }

        if (kind == DeviceKind::Any && !devices.empty())
        {
            LOG(INFO) << "no GPU found, falling back to the first OpenCL device";
            return AcceleratorContext(devices.front());
        }

        throw RankSortError(RankSortError::Stage::DeviceDiscovery, 0, "no matching OpenCL device found");
    }

    AcceleratorContext::AcceleratorContext(const bc::device& device)
        :
        _device(device)
    {
        if (_device.id() == 0)
        {
            throw RankSortError(RankSortError::Stage::ContextCreation, CL_INVALID_DEVICE, "null OpenCL device");
        }

        try
        {
            _context = bc::context(_device);
            _queue = bc::command_queue(_context, _device, bc::command_queue::enable_profiling);
            LOG(INFO) << "using OpenCL device '" << _device.name() << "' (" << _device.platform().name() << ")";
        }
        catch (const bc::opencl_error& e)
        {
            throw RankSortError(RankSortError::Stage::ContextCreation, e.error_code(), e.error_string());
        }

        auto program = BuildProgram(_context, RANK_SORT_KERNEL_STRING);
        try
        {
            _countKernel = program.create_kernel(COUNT_KERNEL_NAME);
            _scatterKernel = program.create_kernel(SCATTER_KERNEL_NAME);
        }
        catch (const bc::opencl_error& e)
        {
            throw RankSortError(RankSortError::Stage::Build, e.error_code(), e.error_string());
        }
    }

    bc::program AcceleratorContext::BuildProgram(const bc::context& context, std::string_view source)
    {
        try
        {
            auto program = bc::program::create_with_source(std::string(source), context);
            program.build(KernelBuildOptions());
            return program;
        }
        catch (const bc::program_build_failure& e)
        {
            LOG(ERROR) << "rank sort program failed to build:\n" << e.build_log();
            throw RankSortError(RankSortError::Stage::Build, e.error_code(), e.error_string() + "\nbuild log:\n" + e.build_log());
        }
        catch (const bc::opencl_error& e)
        {
            throw RankSortError(RankSortError::Stage::Build, e.error_code(), e.error_string());
        }
    }

    std::string AcceleratorContext::Describe() const
    {
        try
        {
            std::ostringstream extensions;
            for (const auto& extension : _device.extensions())
            {
                extensions << extension << ' ';
            }

            auto type = _device.type();
            auto vendorId = _device.get_info<bc::uint_>(CL_DEVICE_VENDOR_ID);
            auto report = boost::format(
                "\tCL_DEVICE_VENDOR: %1%\n"
                "\tCL_DEVICE_VENDOR_ID: %2$X, %13%\n"
                "\tCL_DEVICE_NAME: %3%\n"
                "\tCL_DEVICE_VERSION: %4%\n"
                "\tCL_DRIVER_VERSION: %5%\n"
                "\tCL_DEVICE_TYPE: %6$X, %7%\n"
                "\tCL_DEVICE_PROFILE: %8%\n"
                "\tCL_DEVICE_OPENCL_C_VERSION: %9%\n"
                "\tCL_DEVICE_MAX_COMPUTE_UNITS: %10%\n"
                "\tCL_DEVICE_GLOBAL_MEM_SIZE: %11%\n"
                "\tCL_DEVICE_EXTENSIONS: %12%\n"
                "\tCL_DEVICE_BUILT_IN_KERNELS: %14%\n"
                "\tCL_DEVICE_SVM_CAPABILITIES: %15%\n")
                % _device.vendor()
                % vendorId
                % _device.name()
                % _device.version()
                % _device.driver_version()
                % type
                % device_type_text(type)
                % _device.profile()
                % _device.get_info<std::string>(CL_DEVICE_OPENCL_C_VERSION)
                % _device.compute_units()
                % _device.global_memory_size()
                % extensions.str()
                % vendor_id_text(vendorId)
                % built_in_kernels_text(_device)
                % svm_capabilities_text(_device)
                ;
            return report.str();
        }
        catch (const bc::opencl_error& e)
        {
            throw RankSortError(RankSortError::Stage::DeviceQuery, e.error_code(), e.error_string());
        }
    }

    std::string AcceleratorContext::KernelBuildOptions()
    {
        auto options = boost::format(
            "-cl-std=CL1.2 "
            "-D TARGET_TYPE=%1% "
            "-D SENTINEL=%2% ")
            % ("int")
            % (SENTINEL)
            ;
        return options.str();
    }

    std::string_view AcceleratorContext::KernelSource()
    {
        return RANK_SORT_KERNEL_STRING;
    }
}
