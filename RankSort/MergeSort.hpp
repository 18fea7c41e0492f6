#pragma once
#include <cstddef>
#include <functional>
#include <vector>

namespace RankSort
{
    namespace detail
    {
        // takes the smaller front element each step, left wins ties
        template<typename T, typename Compare>
        std::vector<T> merge_halves(const std::vector<T>& left, const std::vector<T>& right, Compare& comp)
        {
            std::vector<T> merged;
            merged.reserve(left.size() + right.size());

            std::size_t i = 0;
            std::size_t j = 0;
            while (i < left.size() && j < right.size())
            {
                if (comp(right[j], left[i]))
                {
                    merged.push_back(right[j++]);
                }
                else
                {
                    merged.push_back(left[i++]);
                }
            }

            merged.insert(merged.end(), left.begin() + i, left.end());
            merged.insert(merged.end(), right.begin() + j, right.end());
            return merged;
        }

        template<typename T, typename Iterator, typename Compare>
        std::vector<T> merge_sort(Iterator first, Iterator last, Compare& comp)
        {
            auto size = last - first;
            if (size < 2)
            {
                return std::vector<T>(first, last);
            }

            auto middle = first + size / 2;
            return merge_halves(
                merge_sort<T>(first, middle, comp),
                merge_sort<T>(middle, last, comp),
                comp);
        }
    }

    // Recursive top down merge sort on the host. Stable, returns a sorted copy.
    template<typename T, typename Compare = std::less<T>>
    std::vector<T> MergeSort(const std::vector<T>& values, Compare comp = Compare{})
    {
        return detail::merge_sort<T>(values.cbegin(), values.cend(), comp);
    }
}
