#include "pch.hpp"
#include <boost/program_options/errors.hpp>
#include "../RankSort/AcceleratorContext.hpp"
#include "../RankSort/GPURankSorter.hpp"
#include "../RankSort/MergeSort.hpp"
#include "../RankSort/RankSortError.hpp"
#include "../RankSort/SortConfig.hpp"
#include "Report.hpp"

using namespace RankSort;

namespace
{
    int run(const SortOptions& parsed)
    {
        auto options = parsed;
        auto accelerator = AcceleratorContext::Create(options.device);
        std::cout << accelerator.Describe() << std::endl;

        PromptForMissing(options, std::cin, std::cout);

        auto seed = options.seedGiven ? options.seed : std::random_device{}();
        auto input = GenerateInput(options.arraySize, options.maxValue, seed);
        LOG(INFO) << "sorting " << input.size() << " values below " << options.maxValue << ", seed " << seed;

        GPURankSorter sorter(accelerator);
        auto parallelResult = sorter.Sort(input);

        if (options.printArrays)
        {
            PrintArray(std::cout, "Array to Sort", input);
            PrintArray(std::cout, "Parallel Sorted Array", parallelResult);
        }
        PrintDuration(std::cout, "Parallel", sorter.DeviceDuration());
        std::cout << '\n';

        auto start = std::chrono::steady_clock::now();
        auto mergeResult = MergeSort(input);
        auto end = std::chrono::steady_clock::now();

        if (options.printArrays)
        {
            PrintArray(std::cout, "MergeSort Sorted Array", mergeResult);
        }
        PrintDuration(std::cout, "MergeSort", std::chrono::duration_cast<std::chrono::nanoseconds>(end - start));

        if (options.verify && parallelResult != mergeResult)
        {
            LOG(ERROR) << "parallel result differs from merge sort, "
                << sorter.DroppedCount() << " elements were dropped";
            return 1;
        }
        return 0;
    }
}

int main(int argc, char* argv[])
{
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    try
    {
        auto options = ParseCommandLine(argc, argv);
        if (!options)
        {
            std::cout << Usage() << std::endl;
            return 0;
        }
        FLAGS_v = options->verbosity;

        return run(*options);
    }
    catch (const boost::program_options::error& e)
    {
        LOG(ERROR) << e.what() << "\n" << Usage();
    }
    catch (const RankSortError& e)
    {
        LOG(ERROR) << e.what();
    }
    catch (const std::exception& e)
    {
        LOG(ERROR) << e.what();
    }
    return 1;
}
