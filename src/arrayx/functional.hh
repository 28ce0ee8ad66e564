#pragma once

#include <arrayx/error.hh>
#include <arrayx/fwd.hh>
#include <arrayx/range.hh>
#include <arrayx/span.hh>
#include <arrayx/utility.hh>

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

// =========================================================================================================
// Functional transforms on generic arrays
// =========================================================================================================
//
// Mapping:
//   map(values, fn)                     - fn(v) for every element
//   map_indexed(values, fn)             - fn(v, i) for every element
//   zip_with(a, b, fn)                  - fn(a[i], b[i]) for i < min(|a|, |b|)
//   zip_exact(a, b)                     - pairs {a[i], b[i]}, lengths must match
//   for_each_indexed(values, fn)        - calls fn(v, i), no result
//
// Reductions:
//   fold_left(values, fn)               - ((v0 op v1) op v2) ..., seeded with the first element
//   fold_right(values, fn)              - fn(acc, v) from the back, seeded with the last element
//   sum_by(values, key)                 - sum of key(v), zero for empty input
//   average_by(values, key)             - mean of key(v) as f64
//   join_to_string(values, delimiter)   - operator<< of each element, separated by delimiter
//
// Splitting:
//   partition(values, pred)             - {elements satisfying pred, the others}
//   segment(values, pred)               - a new segment starts at every element satisfying pred
//   group_by_sequential(values, key)    - runs of consecutive elements with equal keys
//   take_while(values, pred)            - longest prefix satisfying pred
//   skip_while(values, pred)            - everything after that prefix
//   sequential_pairs(values)            - {v0, v1}, {v1, v2}, ...
//
// Errors:
//   invalid_argument  - fold_left, fold_right, average_by on empty input
//   length_mismatch   - zip_exact with different lengths
//

namespace ax
{
// =========================================================================================================
// Mapping
// =========================================================================================================

/// Usage:
///   auto const lengths = ax::map(words, [](std::string const& w) { return isize(w.size()); });
template <contiguous_range R, class F>
[[nodiscard]] auto map(R const& values, F&& fn)
{
    using result_t = std::remove_cvref_t<decltype(fn(std::declval<element_t<R> const&>()))>;
    std::vector<result_t> result;
    result.reserve(values.size());
    for (auto const& v : as_span(values))
        result.push_back(fn(v));
    return result;
}

template <contiguous_range R, class F>
[[nodiscard]] auto map_indexed(R const& values, F&& fn)
{
    using result_t = std::remove_cvref_t<decltype(fn(std::declval<element_t<R> const&>(), isize(0)))>;
    auto const s = as_span(values);
    std::vector<result_t> result;
    result.reserve(s.size());
    for (isize i = 0; i < s.size(); ++i)
        result.push_back(fn(s[i], i));
    return result;
}

/// The longer input is truncated
template <contiguous_range A, contiguous_range B, class F>
[[nodiscard]] auto zip_with(A const& a, B const& b, F&& fn)
{
    using result_t = std::remove_cvref_t<decltype(fn(std::declval<element_t<A> const&>(), std::declval<element_t<B> const&>()))>;
    auto const sa = as_span(a);
    auto const sb = as_span(b);
    auto const n = min(sa.size(), sb.size());

    std::vector<result_t> result;
    result.reserve(n);
    for (isize i = 0; i < n; ++i)
        result.push_back(fn(sa[i], sb[i]));
    return result;
}

template <contiguous_range A, contiguous_range B>
[[nodiscard]] std::vector<std::pair<element_t<A>, element_t<B>>> zip_exact(A const& a, B const& b)
{
    auto const sa = as_span(a);
    auto const sb = as_span(b);
    impl::check_same_length(sa.size(), sb.size(), "zip_exact");

    std::vector<std::pair<element_t<A>, element_t<B>>> result;
    result.reserve(sa.size());
    for (isize i = 0; i < sa.size(); ++i)
        result.emplace_back(sa[i], sb[i]);
    return result;
}

template <contiguous_range R, class F>
void for_each_indexed(R const& values, F&& fn)
{
    auto const s = as_span(values);
    for (isize i = 0; i < s.size(); ++i)
        fn(s[i], i);
}

// =========================================================================================================
// Reductions
// =========================================================================================================

/// Usage:
///   ax::fold_left(std::vector{1, 2, 3}, [](int a, int b) { return a - b; })  // (1 - 2) - 3 == -4
template <contiguous_range R, class F>
[[nodiscard]] element_t<R> fold_left(R const& values, F&& fn)
{
    auto const s = as_span(values);
    impl::check_not_empty(s.size(), "fold_left");

    element_t<R> acc = s[0];
    for (isize i = 1; i < s.size(); ++i)
        acc = fn(std::move(acc), s[i]);
    return acc;
}

/// Usage:
///   ax::fold_right(std::vector{1, 2, 3}, [](int acc, int v) { return acc - v; })  // (3 - 2) - 1 == 0
template <contiguous_range R, class F>
[[nodiscard]] element_t<R> fold_right(R const& values, F&& fn)
{
    auto const s = as_span(values);
    impl::check_not_empty(s.size(), "fold_right");

    element_t<R> acc = s.back();
    for (isize i = s.size() - 2; i >= 0; --i)
        acc = fn(std::move(acc), s[i]);
    return acc;
}

template <contiguous_range R, class Key>
[[nodiscard]] auto sum_by(R const& values, Key&& key)
{
    using sum_t = std::remove_cvref_t<decltype(key(std::declval<element_t<R> const&>()))>;
    sum_t sum = {};
    for (auto const& v : as_span(values))
        sum += key(v);
    return sum;
}

template <contiguous_range R, class Key>
[[nodiscard]] f64 average_by(R const& values, Key&& key)
{
    auto const s = as_span(values);
    impl::check_not_empty(s.size(), "average_by");

    f64 sum = 0;
    for (auto const& v : s)
        sum += static_cast<f64>(key(v));
    return sum / static_cast<f64>(s.size());
}

/// Usage:
///   ax::join_to_string(std::vector{1, 2, 3}, ", ")  // "1, 2, 3"
template <contiguous_range R>
    requires requires(std::ostream& os, element_t<R> const& v) { os << v; }
[[nodiscard]] std::string join_to_string(R const& values, std::string_view delimiter)
{
    std::ostringstream ss;
    auto first = true;
    for (auto const& v : as_span(values))
    {
        if (!first)
            ss << delimiter;
        ss << v;
        first = false;
    }
    return ss.str();
}

// =========================================================================================================
// Splitting
// =========================================================================================================

template <contiguous_range R, class Pred>
[[nodiscard]] std::pair<std::vector<element_t<R>>, std::vector<element_t<R>>> partition(R const& values, Pred&& pred)
{
    std::pair<std::vector<element_t<R>>, std::vector<element_t<R>>> result;
    for (auto const& v : as_span(values))
        (pred(v) ? result.first : result.second).push_back(v);
    return result;
}

/// Usage:
///   ax::segment(std::vector{1, 2, 0, 3, 0, 4}, [](int v) { return v == 0; })  // {{1, 2}, {0, 3}, {0, 4}}
template <contiguous_range R, class Pred>
[[nodiscard]] std::vector<std::vector<element_t<R>>> segment(R const& values, Pred&& pred)
{
    std::vector<std::vector<element_t<R>>> result;
    std::vector<element_t<R>> current;
    for (auto const& v : as_span(values))
    {
        if (pred(v) && !current.empty())
            result.push_back(std::exchange(current, {}));
        current.push_back(v);
    }
    if (!current.empty())
        result.push_back(std::move(current));
    return result;
}

/// Each run is reported with its key. Equal keys that are not adjacent form separate runs.
/// Usage:
///   ax::group_by_sequential(std::vector{1, 3, 2, 4, 5}, [](int v) { return v % 2; })
///   // {{1, {1, 3}}, {0, {2, 4}}, {1, {5}}}
template <contiguous_range R, class Key>
[[nodiscard]] auto group_by_sequential(R const& values, Key&& key)
{
    using key_t = std::remove_cvref_t<decltype(key(std::declval<element_t<R> const&>()))>;
    std::vector<std::pair<key_t, std::vector<element_t<R>>>> result;
    for (auto const& v : as_span(values))
    {
        auto k = key(v);
        if (result.empty() || !(result.back().first == k))
            result.emplace_back(std::move(k), std::vector<element_t<R>>{});
        result.back().second.push_back(v);
    }
    return result;
}

template <contiguous_range R, class Pred>
[[nodiscard]] std::vector<element_t<R>> take_while(R const& values, Pred&& pred)
{
    std::vector<element_t<R>> result;
    for (auto const& v : as_span(values))
    {
        if (!pred(v))
            break;
        result.push_back(v);
    }
    return result;
}

template <contiguous_range R, class Pred>
[[nodiscard]] std::vector<element_t<R>> skip_while(R const& values, Pred&& pred)
{
    auto const s = as_span(values);
    isize start = 0;
    while (start < s.size() && pred(s[start]))
        ++start;
    auto const rest = s.subspan(start);
    return std::vector<element_t<R>>(rest.begin(), rest.end());
}

/// n - 1 overlapping pairs, none for fewer than two elements
template <contiguous_range R>
[[nodiscard]] std::vector<std::pair<element_t<R>, element_t<R>>> sequential_pairs(R const& values)
{
    auto const s = as_span(values);
    std::vector<std::pair<element_t<R>, element_t<R>>> result;
    for (isize i = 1; i < s.size(); ++i)
        result.emplace_back(s[i - 1], s[i]);
    return result;
}

} // namespace ax
