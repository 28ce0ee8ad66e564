#include "numeric.hh"

#include <arrayx/error.hh>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace
{
std::vector<ax::f64> sorted_copy(ax::span<ax::f64 const> values)
{
    std::vector<ax::f64> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

ax::f64 sum_of(ax::span<ax::f64 const> values)
{
    ax::f64 sum = 0;
    for (auto v : values)
        sum += v;
    return sum;
}

// k-th central moment divided by sd^k, 0 for zero deviation
ax::f64 standardized_moment(ax::span<ax::f64 const> values, int k)
{
    auto const m = sum_of(values) / ax::f64(values.size());
    auto const sd = ax::standard_deviation(values);
    if (sd == 0)
        return 0;

    ax::f64 sum = 0;
    for (auto v : values)
        sum += std::pow((v - m) / sd, k);
    return sum / ax::f64(values.size());
}

// same interpolation as ax::percentile, on already sorted data
ax::f64 interpolate_sorted(std::vector<ax::f64> const& sorted, ax::f64 p)
{
    auto const index = p / 100.0 * ax::f64(sorted.size() - 1);
    auto const lower = ax::isize(std::floor(index));
    auto const upper = ax::isize(std::ceil(index));
    if (lower == upper)
        return sorted[lower];

    auto const weight = index - ax::f64(lower);
    return sorted[lower] * (1 - weight) + sorted[upper] * weight;
}
} // namespace

// =========================================================================================================
// Summaries
// =========================================================================================================

ax::f64 ax::mean(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "mean");
    return sum_of(values) / f64(values.size());
}

ax::f64 ax::range(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "range");
    auto const [lo, hi] = std::minmax_element(values.begin(), values.end());
    return *hi - *lo;
}

ax::f64 ax::median(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "median");
    auto const sorted = sorted_copy(values);
    auto const mid = isize(sorted.size()) / 2;

    if (sorted.size() % 2 == 0)
        return std::midpoint(sorted[mid - 1], sorted[mid]);
    return sorted[mid];
}

ax::f64 ax::percentile(span<f64 const> values, f64 p)
{
    impl::check_not_empty(values.size(), "percentile");
    impl::check_value(p, 0, 100, "percentile", "p");
    return interpolate_sorted(sorted_copy(values), p);
}

ax::f64 ax::variance(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "variance");
    auto const m = sum_of(values) / f64(values.size());

    f64 sum = 0;
    for (auto v : values)
        sum += (v - m) * (v - m);
    return sum / f64(values.size());
}

ax::f64 ax::standard_deviation(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "standard_deviation");
    return std::sqrt(variance(values));
}

ax::f64 ax::skewness(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "skewness");
    return standardized_moment(values, 3);
}

ax::f64 ax::kurtosis(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "kurtosis");
    auto const sd = standard_deviation(values);
    if (sd == 0)
        return 0;
    return standardized_moment(values, 4) - 3;
}

ax::f64 ax::correlation(span<f64 const> a, span<f64 const> b)
{
    impl::check_same_length(a.size(), b.size(), "correlation");
    impl::check_not_empty(a.size(), "correlation");

    auto const mean_a = sum_of(a) / f64(a.size());
    auto const mean_b = sum_of(b) / f64(b.size());

    f64 numerator = 0;
    f64 sq_a = 0;
    f64 sq_b = 0;
    for (isize i = 0; i < a.size(); ++i)
    {
        auto const da = a[i] - mean_a;
        auto const db = b[i] - mean_b;
        numerator += da * db;
        sq_a += da * da;
        sq_b += db * db;
    }

    auto const denominator = std::sqrt(sq_a * sq_b);
    return denominator == 0 ? 0 : numerator / denominator;
}

// =========================================================================================================
// Transforms
// =========================================================================================================

std::vector<ax::f64> ax::normalize(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "normalize");
    auto const [lo, hi] = std::minmax_element(values.begin(), values.end());
    auto const min = *lo;
    auto const width = *hi - *lo;

    std::vector<f64> result(values.size(), 0.0);
    if (width == 0)
        return result;

    for (isize i = 0; i < values.size(); ++i)
        result[i] = (values[i] - min) / width;
    return result;
}

std::vector<ax::f64> ax::standardize(span<f64 const> values)
{
    impl::check_not_empty(values.size(), "standardize");
    auto const m = mean(values);
    auto const sd = standard_deviation(values);

    std::vector<f64> result(values.size(), 0.0);
    if (sd == 0)
        return result;

    for (isize i = 0; i < values.size(); ++i)
        result[i] = (values[i] - m) / sd;
    return result;
}

std::vector<ax::f64> ax::moving_average(span<f64 const> values, isize window)
{
    impl::check_not_empty(values.size(), "moving_average");
    impl::check_value(f64(window), 1, f64(values.size()), "moving_average", "window");

    auto const half = window / 2;
    auto const n = values.size();

    std::vector<f64> result(n);
    for (isize i = 0; i < n; ++i)
    {
        auto const start = std::max(isize(0), i - half);
        auto const end = std::min(n - 1, i + half);

        f64 sum = 0;
        for (auto j = start; j <= end; ++j)
            sum += values[j];
        result[i] = sum / f64(end - start + 1);
    }
    return result;
}

std::vector<ax::f64> ax::round_all(span<f64 const> values, int decimals)
{
    impl::check_value(decimals, 0, 15, "round_all", "decimals");
    auto const scale = std::pow(10.0, decimals);

    std::vector<f64> result;
    result.reserve(values.size());
    for (auto v : values)
    {
        // nearbyint uses the current rounding mode, which defaults to round-half-to-even
        auto const r = std::nearbyint(v * scale) / scale;
        result.push_back(std::isfinite(r) ? r : v);
    }
    return result;
}

std::vector<ax::f64> ax::cumulative_sum(span<f64 const> values)
{
    std::vector<f64> result;
    result.reserve(values.size());
    f64 running = 0;
    for (auto v : values)
    {
        running += v;
        result.push_back(running);
    }
    return result;
}

std::vector<ax::f64> ax::diff(span<f64 const> values)
{
    std::vector<f64> result;
    for (isize i = 1; i < values.size(); ++i)
        result.push_back(values[i] - values[i - 1]);
    return result;
}

std::vector<ax::f64> ax::remove_non_finite(span<f64 const> values)
{
    std::vector<f64> result;
    for (auto v : values)
        if (std::isfinite(v))
            result.push_back(v);
    return result;
}

// =========================================================================================================
// Queries
// =========================================================================================================

bool ax::all_finite(span<f64 const> values)
{
    return std::all_of(values.begin(), values.end(), [](f64 v) { return std::isfinite(v); });
}

std::vector<ax::isize> ax::local_maxima(span<f64 const> values)
{
    std::vector<isize> result;
    for (isize i = 1; i + 1 < values.size(); ++i)
        if (values[i] > values[i - 1] && values[i] > values[i + 1])
            result.push_back(i);
    return result;
}

std::vector<ax::isize> ax::local_minima(span<f64 const> values)
{
    std::vector<isize> result;
    for (isize i = 1; i + 1 < values.size(); ++i)
        if (values[i] < values[i - 1] && values[i] < values[i + 1])
            result.push_back(i);
    return result;
}

std::vector<ax::f64> ax::find_outliers(span<f64 const> values, f64 k)
{
    impl::check_not_empty(values.size(), "find_outliers");

    auto const sorted = sorted_copy(values);
    auto const q1 = interpolate_sorted(sorted, 25);
    auto const q3 = interpolate_sorted(sorted, 75);
    auto const iqr = q3 - q1;
    auto const lower = q1 - k * iqr;
    auto const upper = q3 + k * iqr;

    std::vector<f64> result;
    for (auto v : values)
        if (v < lower || v > upper)
            result.push_back(v);
    return result;
}
