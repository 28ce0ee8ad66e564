#pragma once

#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <string>
#include <vector>

// =========================================================================================================
// Operations on bool arrays
// =========================================================================================================
//
// Inputs are span<bool const>, i.e. bool[N], std::array<bool, N> or a braced list.
// std::vector<bool> is packed and cannot be viewed as a span. Results that are bool sequences are
// returned as std::vector<bool> anyway since that is what callers store them in.
//
//   count_true / count_false
//   all_true / all_false / any_true / any_false      - vacuous truth for empty input
//   invert(values)
//   and_each / or_each / xor_each(a, b)              - element-wise, length_mismatch on unequal lengths
//   true_indices / false_indices
//   true_percentage / false_percentage               - in [0, 100], 0 for empty input
//   first_true / last_true / first_false / last_false - index or -1
//   to_binary_string(values)                         - "1011"
//   to_int_array(values)                             - {1, 0, 1, 1}
//   true_runs / false_runs                           - maximal runs as {start, length}
//   longest_true_run / longest_false_run             - {-1, 0} if there is no run, first run wins ties
//

namespace ax
{
/// maximal run of equal values
struct bool_run
{
    isize start = -1;
    isize length = 0;

    bool operator==(bool_run const&) const = default;
};

[[nodiscard]] isize count_true(span<bool const> values);
[[nodiscard]] isize count_false(span<bool const> values);

[[nodiscard]] bool all_true(span<bool const> values);
[[nodiscard]] bool all_false(span<bool const> values);
[[nodiscard]] bool any_true(span<bool const> values);
[[nodiscard]] bool any_false(span<bool const> values);

[[nodiscard]] std::vector<bool> invert(span<bool const> values);
[[nodiscard]] std::vector<bool> and_each(span<bool const> a, span<bool const> b);
[[nodiscard]] std::vector<bool> or_each(span<bool const> a, span<bool const> b);
[[nodiscard]] std::vector<bool> xor_each(span<bool const> a, span<bool const> b);

[[nodiscard]] std::vector<isize> true_indices(span<bool const> values);
[[nodiscard]] std::vector<isize> false_indices(span<bool const> values);

[[nodiscard]] f64 true_percentage(span<bool const> values);
[[nodiscard]] f64 false_percentage(span<bool const> values);

[[nodiscard]] isize first_true(span<bool const> values);
[[nodiscard]] isize last_true(span<bool const> values);
[[nodiscard]] isize first_false(span<bool const> values);
[[nodiscard]] isize last_false(span<bool const> values);

[[nodiscard]] std::string to_binary_string(span<bool const> values);
[[nodiscard]] std::vector<i32> to_int_array(span<bool const> values);

[[nodiscard]] std::vector<bool_run> true_runs(span<bool const> values);
[[nodiscard]] std::vector<bool_run> false_runs(span<bool const> values);
[[nodiscard]] bool_run longest_true_run(span<bool const> values);
[[nodiscard]] bool_run longest_false_run(span<bool const> values);
} // namespace ax
