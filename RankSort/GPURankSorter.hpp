#pragma once
#include <chrono>
#include <cstddef>
#include <vector>
#include <boost/compute/core.hpp>
#include <boost/compute/utility/wait_list.hpp>
#include "sort_types.hpp"
#include "AcceleratorContext.hpp"

namespace RankSort
{
    // All-pairs rank sort on the accelerator.
    //
    // Sort() runs upload -> rank_count -> rank_scatter -> download with every
    // step waiting on the events of the steps it depends on. Buffers are
    // allocated per call. Equal elements are not kept in input order.
    //
    // Failures of any stage throw RankSortError, bad input throws
    // std::invalid_argument.
    class GPURankSorter
    {
    public:
        explicit GPURankSorter(AcceleratorContext& accelerator);

        std::vector<data_t> Sort(const std::vector<data_t>& source);

        // rank of every element, the number of elements smaller than it
        std::vector<data_t> Ranks(const std::vector<data_t>& source);

        // scatter stage alone, ranks must have the size of source and lie in [0, size)
        std::vector<data_t> Scatter(const std::vector<data_t>& source, const std::vector<data_t>& ranks);

        // device times of the last call, zero for stages that did not run
        std::chrono::nanoseconds CountDuration() const { return _countDuration; }
        std::chrono::nanoseconds ScatterDuration() const { return _scatterDuration; }
        std::chrono::nanoseconds DeviceDuration() const { return _countDuration + _scatterDuration; }

        // result slots left empty by the last Sort() or Scatter()
        std::size_t DroppedCount() const { return _droppedCount; }

    private:
        boost::compute::buffer Allocate(std::size_t count, cl_mem_flags flags);
        boost::compute::event Upload(const boost::compute::buffer& buffer, const std::vector<data_t>& values);

        boost::compute::event EnqueueCount(
            const boost::compute::buffer& source,
            const boost::compute::buffer& ranks,
            std::size_t count,
            const boost::compute::wait_list& dependencies);

        boost::compute::event EnqueueScatter(
            const boost::compute::buffer& source,
            const boost::compute::buffer& ranks,
            const boost::compute::buffer& results,
            std::size_t count,
            const boost::compute::wait_list& dependencies);

        std::vector<data_t> Download(
            const boost::compute::buffer& buffer,
            std::size_t count,
            const boost::compute::wait_list& dependencies);

        void ResetStatistics();
        void CheckDropped(const std::vector<data_t>& results);

        AcceleratorContext& _accelerator;

        std::chrono::nanoseconds _countDuration{};
        std::chrono::nanoseconds _scatterDuration{};
        std::size_t _droppedCount = 0;
    };
}
