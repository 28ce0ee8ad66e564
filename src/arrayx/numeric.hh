#pragma once

#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <vector>

// =========================================================================================================
// Statistics and transforms on f64 arrays
// =========================================================================================================
//
// All statistics use the population definitions (divisor n, not n - 1).
// None of the operations modify their input, sorting happens on a copy.
//
// Summaries:
//   mean(values)                    - arithmetic mean
//   range(values)                   - max - min
//   median(values)                  - middle element, midpoint of the two central ones for even n
//   percentile(values, p)           - linear interpolation at p/100 * (n - 1) of the sorted values
//   variance(values)                - mean squared deviation from the mean
//   standard_deviation(values)      - sqrt(variance)
//   skewness(values)                - third standardized moment, 0 if the deviation is 0
//   kurtosis(values)                - EXCESS kurtosis (fourth moment - 3), 0 if the deviation is 0
//   correlation(a, b)               - Pearson coefficient, 0 if either side is constant
//
// Transforms:
//   normalize(values)               - min-max scaling to [0, 1], all zeros for constant input
//   standardize(values)             - z-scores, all zeros for zero deviation
//   moving_average(values, window)  - centered mean over [i - window/2, i + window/2], clipped at the ends
//   round_all(values, decimals)     - round half to even at the given number of decimals
//   cumulative_sum(values)          - running totals
//   diff(values)                    - v[i] - v[i - 1], empty for fewer than two values
//   remove_non_finite(values)       - drops NaN and +-inf
//
// Queries:
//   all_finite(values)              - no NaN or +-inf
//   local_maxima(values)            - interior indices strictly greater than both neighbours
//   local_minima(values)            - interior indices strictly less than both neighbours
//   find_outliers(values, k)        - values outside [Q1 - k*IQR, Q3 + k*IQR], k defaults to 1.5
//
// Errors:
//   invalid_argument    - empty input for every summary, normalize, standardize, moving_average, find_outliers
//   value_out_of_range  - p outside [0, 100], window outside [1, n], decimals outside [0, 15]
//   length_mismatch     - correlation of different lengths
//
// Note: the integer module has median/variance/standard_deviation overloads for span<i32 const>.
//       Pass a typed container (std::vector<f64>) rather than a bare braced list to those three.
//

namespace ax
{
// summaries
[[nodiscard]] f64 mean(span<f64 const> values);
[[nodiscard]] f64 range(span<f64 const> values);
[[nodiscard]] f64 median(span<f64 const> values);
[[nodiscard]] f64 percentile(span<f64 const> values, f64 p);
[[nodiscard]] f64 variance(span<f64 const> values);
[[nodiscard]] f64 standard_deviation(span<f64 const> values);
[[nodiscard]] f64 skewness(span<f64 const> values);
[[nodiscard]] f64 kurtosis(span<f64 const> values);
[[nodiscard]] f64 correlation(span<f64 const> a, span<f64 const> b);

// transforms
[[nodiscard]] std::vector<f64> normalize(span<f64 const> values);
[[nodiscard]] std::vector<f64> standardize(span<f64 const> values);
[[nodiscard]] std::vector<f64> moving_average(span<f64 const> values, isize window);
[[nodiscard]] std::vector<f64> round_all(span<f64 const> values, int decimals);
[[nodiscard]] std::vector<f64> cumulative_sum(span<f64 const> values);
[[nodiscard]] std::vector<f64> diff(span<f64 const> values);
[[nodiscard]] std::vector<f64> remove_non_finite(span<f64 const> values);

// queries
[[nodiscard]] bool all_finite(span<f64 const> values);
[[nodiscard]] std::vector<isize> local_maxima(span<f64 const> values);
[[nodiscard]] std::vector<isize> local_minima(span<f64 const> values);
[[nodiscard]] std::vector<f64> find_outliers(span<f64 const> values, f64 k = 1.5);
} // namespace ax
