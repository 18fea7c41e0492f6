#include "pch.hpp"
#include <catch2/catch.hpp>
#include "tests.utils.hpp"
#include "../RankSort/GPURankSorter.hpp"
#include "../RankSort/MergeSort.hpp"

using namespace RankSort;

TEST_CASE("rank sort - small inputs", "[algo] [sort]")
{
    GPURankSorter sorter(test_accelerator());

    SECTION("empty input")
    {
        REQUIRE(sorter.Sort({}).empty());
        REQUIRE(sorter.DeviceDuration().count() == 0);
    }

    SECTION("single element")
    {
        REQUIRE(sorter.Sort({ 42 }) == std::vector<data_t>{ 42 });
    }

    SECTION("duplicates in the middle")
    {
        std::vector<data_t> host_vec{ 5, 3, 3, 1 };
        REQUIRE(sorter.Ranks(host_vec) == std::vector<data_t>{ 3, 1, 1, 0 });
        REQUIRE(sorter.Sort(host_vec) == std::vector<data_t>{ 1, 3, 3, 5 });
    }

    SECTION("all elements equal")
    {
        std::vector<data_t> host_vec{ 2, 2, 2 };
        REQUIRE(sorter.Ranks(host_vec) == std::vector<data_t>{ 0, 0, 0 });
        REQUIRE(sorter.Sort(host_vec) == std::vector<data_t>{ 2, 2, 2 });
        REQUIRE(sorter.DroppedCount() == 0);
    }
}

TEST_CASE("rank sort - strictly descending input", "[algo] [sort]")
{
    GPURankSorter sorter(test_accelerator());

    const int count = 1000;
    std::vector<data_t> host_vec(count);
    std::iota(host_vec.rbegin(), host_vec.rend(), 0);

    auto ranks = sorter.Ranks(host_vec);
    for (int i = 0; i < count; ++i)
    {
        REQUIRE(ranks[i] == count - 1 - i);
    }

    auto result = sorter.Sort(host_vec);
    REQUIRE(std::equal(result.begin(), result.end(), host_vec.rbegin()));
}

TEST_CASE("rank sort - sorted input is unchanged", "[algo] [sort]")
{
    GPURankSorter sorter(test_accelerator());

    auto host_vec = MergeSort(generate_uniformly_distributed_vec(700, 0, 50));
    REQUIRE(sorter.Sort(host_vec) == host_vec);
}

TEST_CASE("rank sort - distinct values match merge sort", "[algo] [sort]")
{
    GPURankSorter sorter(test_accelerator());

    std::vector<data_t> host_vec(2048);
    std::iota(host_vec.begin(), host_vec.end(), 0);
    std::shuffle(host_vec.begin(), host_vec.end(), std::default_random_engine{ 7 });

    auto result = sorter.Sort(host_vec);
    REQUIRE(result == MergeSort(host_vec));
}

TEST_CASE("rank sort - random input with duplicates", "[algo] [sort]")
{
    GPURankSorter sorter(test_accelerator());

    auto checker = [&](std::size_t count, data_t max_value)
    {
        auto host_vec = generate_uniformly_distributed_vec(count, 0, max_value, static_cast<unsigned>(count));
        auto result = sorter.Sort(host_vec);

        REQUIRE(result.size() == host_vec.size());
        REQUIRE(std::is_sorted(result.begin(), result.end()));
        REQUIRE(std::is_permutation(result.begin(), result.end(), host_vec.begin()));
        REQUIRE(sorter.DroppedCount() == 0);
    };

    SECTION("few distinct values")
    {
        checker(1000, 4);
    }
    SECTION("some distinct values")
    {
        checker(1500, 100);
    }
    SECTION("mostly distinct values")
    {
        checker(1777, 100000);
    }
}

TEST_CASE("rank sort - long duplicate runs at the top of the range", "[algo] [sort] [scatter]")
{
    GPURankSorter sorter(test_accelerator());
    const data_t max_value = 1000;

    SECTION("run ends at the last slot")
    {
        auto host_vec = generate_uniformly_distributed_vec(512, 0, max_value - 1, 3u);
        host_vec.insert(host_vec.end(), 1536, max_value - 1);
        std::shuffle(host_vec.begin(), host_vec.end(), std::default_random_engine{ 11 });

        auto result = sorter.Sort(host_vec);
        REQUIRE(sorter.DroppedCount() == 0);
        REQUIRE(result == MergeSort(host_vec));
        REQUIRE(std::count(result.end() - 1536, result.end(), max_value - 1) == 1536);
    }

    SECTION("every element is the maximum")
    {
        std::vector<data_t> host_vec(4096, max_value - 1);
        auto result = sorter.Sort(host_vec);
        REQUIRE(sorter.DroppedCount() == 0);
        REQUIRE(result == host_vec);
    }

    SECTION("two runs at the top")
    {
        std::vector<data_t> host_vec(1000, max_value - 1);
        host_vec.insert(host_vec.end(), 1000, max_value - 2);
        auto result = sorter.Sort(host_vec);
        REQUIRE(sorter.DroppedCount() == 0);
        REQUIRE(result == MergeSort(host_vec));
    }
}

TEST_CASE("rank sort - scatter with supplied ranks", "[algo] [scatter]")
{
    GPURankSorter sorter(test_accelerator());

    SECTION("consistent ranks place every element")
    {
        std::vector<data_t> host_vec{ 9, 4, 4, 4, 0 };
        auto result = sorter.Scatter(host_vec, { 4, 1, 1, 1, 0 });
        REQUIRE(result == std::vector<data_t>{ 0, 4, 4, 4, 9 });
        REQUIRE(sorter.DroppedCount() == 0);
        REQUIRE(sorter.CountDuration().count() == 0);
    }

    SECTION("crowded ranks drop what does not fit")
    {
        auto result = sorter.Scatter({ 1, 2, 3, 4 }, { 2, 2, 2, 2 });
        REQUIRE(sorter.DroppedCount() == 2);
        REQUIRE(result[0] == SENTINEL);
        REQUIRE(result[1] == SENTINEL);
    }

    SECTION("ranks outside the array are rejected")
    {
        REQUIRE_THROWS_AS(sorter.Scatter({ 1, 2 }, { 0, 2 }), std::invalid_argument);
        REQUIRE_THROWS_AS(sorter.Scatter({ 1, 2 }, { -1, 0 }), std::invalid_argument);
        REQUIRE_THROWS_AS(sorter.Scatter({ 1, 2 }, { 0 }), std::invalid_argument);
    }
}

TEST_CASE("rank sort - sentinel value is rejected", "[algo] [sort]")
{
    GPURankSorter sorter(test_accelerator());

    REQUIRE_THROWS_AS(sorter.Sort({ 3, SENTINEL, 1 }), std::invalid_argument);
    REQUIRE_THROWS_AS(sorter.Ranks({ SENTINEL }), std::invalid_argument);
}

TEST_CASE("rank sort - device timings", "[algo] [profiling]")
{
    GPURankSorter sorter(test_accelerator());
    auto host_vec = generate_uniformly_distributed_vec(1024, 0, 1000);

    sorter.Sort(host_vec);
    CHECK(sorter.CountDuration().count() > 0);
    CHECK(sorter.ScatterDuration().count() > 0);
    REQUIRE(sorter.DeviceDuration() == sorter.CountDuration() + sorter.ScatterDuration());

    sorter.Ranks(host_vec);
    REQUIRE(sorter.ScatterDuration().count() == 0);
    REQUIRE(sorter.DeviceDuration() == sorter.CountDuration());
}

TEST_CASE("rank sort - independent sorters share one context", "[algo] [sort]")
{
    GPURankSorter first(test_accelerator());
    GPURankSorter second(test_accelerator());

    REQUIRE(first.Sort({ 3, 1, 2 }) == std::vector<data_t>{ 1, 2, 3 });
    REQUIRE(second.Sort({ 9, 9, 0 }) == std::vector<data_t>{ 0, 9, 9 });
}
