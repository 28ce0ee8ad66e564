#pragma once

#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <map>
#include <vector>

// =========================================================================================================
// Operations on i32 arrays
// =========================================================================================================
//
// Sums and products are computed in 64 bit.
//
//   sum_even(values) / sum_odd(values)    - sum of the even / odd elements
//   product(values)                       - product of all elements, 1 for empty input
//   sum_abs_differences(values)           - sum of |a - b| over all pairs i < j
//   primes(values)                        - elements that are prime (trial division), in input order
//   average_ignoring_zero(values)         - mean of the non-zero elements
//   is_strictly_increasing(values)        - every element greater than its predecessor (true for n < 2)
//   is_strictly_decreasing(values)        - every element less than its predecessor (true for n < 2)
//   modes(values)                         - distinct values by descending frequency, ties by first occurrence
//   frequencies(values)                   - value -> count
//   percentile_nearest_rank(values, p)    - SORTS values IN PLACE, returns values[max(0, ceil(p/100 * n) - 1)]
//   variance / standard_deviation         - population statistics as f64
//   median(values)                        - same formula as the f64 median
//
// Errors:
//   invalid_argument    - average_ignoring_zero without a non-zero element,
//                         percentile_nearest_rank / variance / standard_deviation / median on empty input
//   value_out_of_range  - p outside [0, 100]
//

namespace ax
{
[[nodiscard]] i64 sum_even(span<i32 const> values);
[[nodiscard]] i64 sum_odd(span<i32 const> values);
[[nodiscard]] i64 product(span<i32 const> values);
[[nodiscard]] i64 sum_abs_differences(span<i32 const> values);

[[nodiscard]] bool is_prime(i32 value);
[[nodiscard]] std::vector<i32> primes(span<i32 const> values);

[[nodiscard]] f64 average_ignoring_zero(span<i32 const> values);

[[nodiscard]] bool is_strictly_increasing(span<i32 const> values);
[[nodiscard]] bool is_strictly_decreasing(span<i32 const> values);

[[nodiscard]] std::vector<i32> modes(span<i32 const> values);
[[nodiscard]] std::map<i32, isize> frequencies(span<i32 const> values);

/// Nearest-rank percentile. Sorts the caller's array ascending as a side effect.
/// Usage:
///   std::vector<i32> v = {40, 10, 30, 20};
///   auto const p = ax::percentile_nearest_rank(v, 50);  // 20, v is now {10, 20, 30, 40}
[[nodiscard]] i32 percentile_nearest_rank(span<i32> values, f64 p);
[[nodiscard]] inline i32 percentile_nearest_rank(std::vector<i32>& values, f64 p)
{
    return percentile_nearest_rank(span<i32>(values), p);
}

[[nodiscard]] f64 variance(span<i32 const> values);
[[nodiscard]] f64 standard_deviation(span<i32 const> values);
[[nodiscard]] f64 median(span<i32 const> values);
} // namespace ax
