#include "pch.hpp"
#include "GPURankSorter.hpp"
#include "RankSortError.hpp"

namespace bc = boost::compute;

namespace RankSort
{
    namespace
    {
        using Stage = RankSortError::Stage;

        // runs one step of the pipeline, runtime failures are reported against that stage
        template<typename Fn>
        auto run_stage(Stage stage, Fn&& fn) -> decltype(fn())
        {
            try
            {
                return fn();
            }
            catch (const bc::opencl_error& e)
            {
                throw RankSortError(stage, e.error_code(), e.error_string());
            }
        }

        std::chrono::nanoseconds elapsed(const bc::event& event)
        {
            return run_stage(Stage::Profiling, [&] { return event.duration<std::chrono::nanoseconds>(); });
        }

        void validate_source(const std::vector<data_t>& source)
        {
            if (source.size() > static_cast<std::size_t>(INT_MAX))
            {
                throw std::invalid_argument("rank sort supports at most INT_MAX elements");
            }
            if (std::find(source.begin(), source.end(), SENTINEL) != source.end())
            {
                throw std::invalid_argument(
                    (boost::format("input contains the reserved sentinel value %1%") % SENTINEL).str());
            }
        }
    }

    GPURankSorter::GPURankSorter(AcceleratorContext& accelerator)
        :
        _accelerator(accelerator)
    {
    }

    std::vector<data_t> GPURankSorter::Sort(const std::vector<data_t>& source)
    {
        validate_source(source);
        ResetStatistics();
        if (source.empty())
        {
            return {};
        }

        auto count = source.size();
        auto sourceBuffer = Allocate(count, bc::buffer::read_only);
        auto ranksBuffer = Allocate(count, bc::buffer::read_write);
        auto resultsBuffer = Allocate(count, bc::buffer::read_write);

        auto sourceWritten = Upload(sourceBuffer, source);
        auto ranksWritten = Upload(ranksBuffer, std::vector<data_t>(count, 0));
        auto resultsWritten = Upload(resultsBuffer, std::vector<data_t>(count, SENTINEL));

        auto counted = EnqueueCount(sourceBuffer, ranksBuffer, count, { sourceWritten, ranksWritten });
        auto scattered = EnqueueScatter(sourceBuffer, ranksBuffer, resultsBuffer, count, { resultsWritten, counted });

        auto results = Download(resultsBuffer, count, { counted, scattered });

        _countDuration = elapsed(counted);
        _scatterDuration = elapsed(scattered);
        VLOG(1) << boost::format("sorted %1% elements, count %2% ns, scatter %3% ns")
            % count % _countDuration.count() % _scatterDuration.count();

        CheckDropped(results);
        return results;
    }

    std::vector<data_t> GPURankSorter::Ranks(const std::vector<data_t>& source)
    {
        validate_source(source);
        ResetStatistics();
        if (source.empty())
        {
            return {};
        }

        auto count = source.size();
        auto sourceBuffer = Allocate(count, bc::buffer::read_only);
        auto ranksBuffer = Allocate(count, bc::buffer::read_write);

        auto sourceWritten = Upload(sourceBuffer, source);
        auto ranksWritten = Upload(ranksBuffer, std::vector<data_t>(count, 0));
        auto counted = EnqueueCount(sourceBuffer, ranksBuffer, count, { sourceWritten, ranksWritten });

        auto ranks = Download(ranksBuffer, count, counted);
        _countDuration = elapsed(counted);
        return ranks;
    }

    std::vector<data_t> GPURankSorter::Scatter(const std::vector<data_t>& source, const std::vector<data_t>& ranks)
    {
        validate_source(source);
        if (ranks.size() != source.size())
        {
            throw std::invalid_argument("ranks and source differ in size");
        }
        auto out_of_range = [&](data_t rank) { return rank < 0 || static_cast<std::size_t>(rank) >= source.size(); };
        if (std::any_of(ranks.begin(), ranks.end(), out_of_range))
        {
            throw std::invalid_argument("rank outside of the result array");
        }
        ResetStatistics();
        if (source.empty())
        {
            return {};
        }

        auto count = source.size();
        auto sourceBuffer = Allocate(count, bc::buffer::read_only);
        auto ranksBuffer = Allocate(count, bc::buffer::read_only);
        auto resultsBuffer = Allocate(count, bc::buffer::read_write);

        auto sourceWritten = Upload(sourceBuffer, source);
        auto ranksWritten = Upload(ranksBuffer, ranks);
        auto resultsWritten = Upload(resultsBuffer, std::vector<data_t>(count, SENTINEL));

        auto scattered = EnqueueScatter(sourceBuffer, ranksBuffer, resultsBuffer, count, { sourceWritten, ranksWritten, resultsWritten });

        auto results = Download(resultsBuffer, count, scattered);
        _scatterDuration = elapsed(scattered);

        CheckDropped(results);
        return results;
    }

    bc::buffer GPURankSorter::Allocate(std::size_t count, cl_mem_flags flags)
    {
        return run_stage(Stage::Allocation, [&] {
            return bc::buffer(_accelerator.Context(), count * sizeof(data_t), flags);
        });
    }

    bc::event GPURankSorter::Upload(const bc::buffer& buffer, const std::vector<data_t>& values)
    {
        // blocking write, the returned event is still fed to the dependents
        return run_stage(Stage::Upload, [&] {
            return _accelerator.Queue().enqueue_write_buffer(buffer, 0, values.size() * sizeof(data_t), values.data());
        });
    }

    bc::event GPURankSorter::EnqueueCount(
        const bc::buffer& source,
        const bc::buffer& ranks,
        std::size_t count,
        const bc::wait_list& dependencies)
    {
        return run_stage(Stage::CountLaunch, [&] {
            auto& kernel = _accelerator.CountKernel();
            kernel.set_args(source, ranks);

            const std::size_t global[2]{ count, count };
            return _accelerator.Queue().enqueue_nd_range_kernel(kernel, 2, nullptr, global, nullptr, dependencies);
        });
    }

    bc::event GPURankSorter::EnqueueScatter(
        const bc::buffer& source,
        const bc::buffer& ranks,
        const bc::buffer& results,
        std::size_t count,
        const bc::wait_list& dependencies)
    {
        return run_stage(Stage::ScatterLaunch, [&] {
            auto& kernel = _accelerator.ScatterKernel();
            kernel.set_args(source, ranks, results, static_cast<bc::uint_>(count));

            const std::size_t global[1]{ count };
            return _accelerator.Queue().enqueue_nd_range_kernel(kernel, 1, nullptr, global, nullptr, dependencies);
        });
    }

    std::vector<data_t> GPURankSorter::Download(
        const bc::buffer& buffer,
        std::size_t count,
        const bc::wait_list& dependencies)
    {
        std::vector<data_t> values(count);
        auto read = run_stage(Stage::Download, [&] {
            return _accelerator.Queue().enqueue_read_buffer(buffer, 0, count * sizeof(data_t), values.data(), dependencies);
        });
        run_stage(Stage::Synchronization, [&] { read.wait(); });
        return values;
    }

    void GPURankSorter::ResetStatistics()
    {
        _countDuration = std::chrono::nanoseconds::zero();
        _scatterDuration = std::chrono::nanoseconds::zero();
        _droppedCount = 0;
    }

    void GPURankSorter::CheckDropped(const std::vector<data_t>& results)
    {
        _droppedCount = static_cast<std::size_t>(std::count(results.begin(), results.end(), SENTINEL));
        if (_droppedCount > 0)
        {
            LOG(WARNING) << _droppedCount << " of " << results.size()
                << " elements found no free slot during rank scatter";
        }
    }
}
