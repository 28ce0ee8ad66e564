#include "integer.hh"

#include <arrayx/error.hh>
#include <arrayx/query.hh>

#include <algorithm>
#include <cmath>
#include <numeric>

ax::i64 ax::sum_even(span<i32 const> values)
{
    i64 sum = 0;
    for (auto v : values)
        if (v % 2 == 0)
            sum += v;
    return sum;
}

ax::i64 ax::sum_odd(span<i32 const> values)
{
    i64 sum = 0;
    for (auto v : values)
        if (v % 2 != 0)
            sum += v;
    return sum;
}

ax::i64 ax::product(span<i32 const> values)
{
    i64 result = 1;
    for (auto v : values)
        result *= v;
    return result;
}

ax::i64 ax::sum_abs_differences(span<i32 const> values)
{
    // after sorting, element i is larger than i predecessors and smaller than n - 1 - i successors
    std::vector<i64> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    i64 sum = 0;
    auto const n = i64(sorted.size());
    for (i64 i = 0; i < n; ++i)
        sum += sorted[i] * (2 * i - (n - 1));
    return sum;
}

bool ax::is_prime(i32 value)
{
    if (value < 2)
        return false;
    for (i64 d = 2; d * d <= value; ++d)
        if (value % d == 0)
            return false;
    return true;
}

std::vector<ax::i32> ax::primes(span<i32 const> values)
{
    std::vector<i32> result;
    for (auto v : values)
        if (is_prime(v))
            result.push_back(v);
    return result;
}

ax::f64 ax::average_ignoring_zero(span<i32 const> values)
{
    i64 sum = 0;
    isize count = 0;
    for (auto v : values)
        if (v != 0)
        {
            sum += v;
            ++count;
        }

    if (count == 0)
        impl::raise_error(error_kind::invalid_argument, "average_ignoring_zero: no non-zero element", ax::source_location::current());
    return f64(sum) / f64(count);
}

bool ax::is_strictly_increasing(span<i32 const> values)
{
    for (isize i = 1; i < values.size(); ++i)
        if (!(values[i - 1] < values[i]))
            return false;
    return true;
}

bool ax::is_strictly_decreasing(span<i32 const> values)
{
    for (isize i = 1; i < values.size(); ++i)
        if (!(values[i - 1] > values[i]))
            return false;
    return true;
}

std::vector<ax::i32> ax::modes(span<i32 const> values)
{
    // first-occurrence order, then a stable sort keeps it for equal counts
    auto counts = impl::count_occurrences(values);
    std::stable_sort(counts.begin(), counts.end(), [](auto const& a, auto const& b) { return a.second > b.second; });

    std::vector<i32> result;
    result.reserve(counts.size());
    for (auto const& [value, count] : counts)
        result.push_back(value);
    return result;
}

std::map<ax::i32, ax::isize> ax::frequencies(span<i32 const> values)
{
    std::map<i32, isize> result;
    for (auto v : values)
        ++result[v];
    return result;
}

ax::i32 ax::percentile_nearest_rank(span<i32> values, f64 p)
{
    impl::check_not_empty(values.size(), "percentile_nearest_rank");
    impl::check_value(p, 0, 100, "percentile_nearest_rank", "p");

    std::sort(values.begin(), values.end());
    auto const rank = isize(std::ceil(p / 100.0 * f64(values.size()))) - 1;
    return values[std::max(isize(0), rank)];
}

ax::f64 ax::variance(span<i32 const> values)
{
    impl::check_not_empty(values.size(), "variance");

    i64 sum = 0;
    for (auto v : values)
        sum += v;
    auto const m = f64(sum) / f64(values.size());

    f64 sq = 0;
    for (auto v : values)
        sq += (v - m) * (v - m);
    return sq / f64(values.size());
}

ax::f64 ax::standard_deviation(span<i32 const> values)
{
    impl::check_not_empty(values.size(), "standard_deviation");
    return std::sqrt(variance(values));
}

ax::f64 ax::median(span<i32 const> values)
{
    impl::check_not_empty(values.size(), "median");
    std::vector<i32> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    auto const mid = isize(sorted.size()) / 2;
    if (sorted.size() % 2 == 0)
        return std::midpoint(f64(sorted[mid - 1]), f64(sorted[mid]));
    return f64(sorted[mid]);
}
