#pragma once

#include <arrayx/error.hh>
#include <arrayx/fwd.hh>
#include <arrayx/range.hh>
#include <arrayx/span.hh>
#include <arrayx/utility.hh>

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

// =========================================================================================================
// Queries and searching on generic arrays
// =========================================================================================================
//
// Never modify the input. Index-returning queries use -1 for "not found".
//
// Membership:
//   is_empty(values)                         - n == 0
//   contains(values, item)                   - true if any element == item
//   count_of(values, item)                   - number of elements == item
//
// Predicates:
//   find_indices(values, pred)               - all indices where pred holds
//   find_or_default(values, pred, fallback)  - first element where pred holds, fallback otherwise
//   find_first_and_last(values, pred)        - first and last element where pred holds (optional)
//
// Shape:
//   all_equal(values)                        - exactly one distinct value (false for empty input)
//   is_unique(values)                        - no value occurs twice
//   is_sorted(values, less)                  - no element is less than its predecessor
//   is_palindrome(values)                    - reads the same backwards
//
// Search:
//   binary_search(sorted, target, less)      - index of an element equivalent to target, or -1
//
// Extremes:
//   most_common(values)                      - most frequent value, earliest first occurrence wins ties
//   min_by(values, key) / max_by(...)        - element with the smallest / largest key, first one wins ties
//

namespace ax
{
namespace impl
{
/// Distinct values of s in first-occurrence order together with how often they occur.
/// O(n) for hashable element types, O(n * distinct) otherwise.
template <class T>
[[nodiscard]] std::vector<std::pair<T, isize>> count_occurrences(span<T const> s)
{
    std::vector<std::pair<T, isize>> counts;

    if constexpr (hashable<T>)
    {
        std::unordered_map<T, isize> slot_of;
        for (auto const& v : s)
        {
            auto const [it, inserted] = slot_of.try_emplace(v, isize(counts.size()));
            if (inserted)
                counts.emplace_back(v, 0);
            ++counts[it->second].second;
        }
    }
    else
    {
        for (auto const& v : s)
        {
            auto found = false;
            for (auto& [value, count] : counts)
                if (value == v)
                {
                    ++count;
                    found = true;
                    break;
                }
            if (!found)
                counts.emplace_back(v, 1);
        }
    }

    return counts;
}
} // namespace impl

// =========================================================================================================
// Membership
// =========================================================================================================

template <contiguous_range R>
[[nodiscard]] bool is_empty(R const& values)
{
    return values.size() == 0;
}

template <contiguous_range R>
[[nodiscard]] bool contains(R const& values, dont_deduce<element_t<R>> const& item)
{
    for (auto const& v : as_span(values))
        if (v == item)
            return true;
    return false;
}

template <contiguous_range R>
[[nodiscard]] isize count_of(R const& values, dont_deduce<element_t<R>> const& item)
{
    isize count = 0;
    for (auto const& v : as_span(values))
        if (v == item)
            ++count;
    return count;
}

// =========================================================================================================
// Predicates
// =========================================================================================================

/// Usage:
///   ax::find_indices(std::vector{1, 4, 2, 8}, [](int v) { return v % 2 == 0; })  // {1, 2, 3}
template <contiguous_range R, class Pred>
[[nodiscard]] std::vector<isize> find_indices(R const& values, Pred&& pred)
{
    std::vector<isize> result;
    auto const s = as_span(values);
    for (isize i = 0; i < s.size(); ++i)
        if (pred(s[i]))
            result.push_back(i);
    return result;
}

template <contiguous_range R, class Pred>
[[nodiscard]] element_t<R> find_or_default(R const& values, Pred&& pred, dont_deduce<element_t<R>> const& fallback = {})
{
    for (auto const& v : as_span(values))
        if (pred(v))
            return v;
    return fallback;
}

/// nullopt if no element satisfies pred, {x, x} if exactly one does
template <contiguous_range R, class Pred>
[[nodiscard]] std::optional<std::pair<element_t<R>, element_t<R>>> find_first_and_last(R const& values, Pred&& pred)
{
    auto const s = as_span(values);

    isize first = -1;
    for (isize i = 0; i < s.size(); ++i)
        if (pred(s[i]))
        {
            first = i;
            break;
        }
    if (first < 0)
        return std::nullopt;

    isize last = first;
    for (isize i = s.size() - 1; i > first; --i)
        if (pred(s[i]))
        {
            last = i;
            break;
        }

    return std::pair<element_t<R>, element_t<R>>(s[first], s[last]);
}

// =========================================================================================================
// Shape
// =========================================================================================================

/// Exactly one distinct value: {} is false, {x} is true
template <contiguous_range R>
[[nodiscard]] bool all_equal(R const& values)
{
    auto const s = as_span(values);
    if (s.empty())
        return false;
    for (auto const& v : s)
        if (!(v == s.front()))
            return false;
    return true;
}

template <contiguous_range R>
[[nodiscard]] bool is_unique(R const& values)
{
    auto const s = as_span(values);
    return isize(impl::count_occurrences(s).size()) == s.size();
}

template <contiguous_range R, class Less = less_function>
[[nodiscard]] bool is_sorted(R const& values, Less&& less = {})
{
    auto const s = as_span(values);
    for (isize i = 1; i < s.size(); ++i)
        if (less(s[i], s[i - 1]))
            return false;
    return true;
}

template <contiguous_range R>
[[nodiscard]] bool is_palindrome(R const& values)
{
    auto const s = as_span(values);
    for (isize i = 0, j = s.size() - 1; i < j; ++i, --j)
        if (!(s[i] == s[j]))
            return false;
    return true;
}

// =========================================================================================================
// Search
// =========================================================================================================

/// Classic bounded binary search on [0, n - 1]
/// The input must be sorted by less, this is not checked.
/// With duplicates, any of the equivalent elements may be returned.
/// Usage:
///   ax::binary_search(std::vector{1, 3, 5, 7}, 5)  // 2
///   ax::binary_search(std::vector{1, 3, 5, 7}, 4)  // -1
///   ax::binary_search(desc, 5, ax::greater_function{})
template <contiguous_range R, class Less = less_function>
[[nodiscard]] isize binary_search(R const& sorted, dont_deduce<element_t<R>> const& target, Less&& less = {})
{
    auto const s = as_span(sorted);

    isize low = 0;
    isize high = s.size() - 1;
    while (low <= high)
    {
        auto const mid = low + (high - low) / 2;
        if (less(s[mid], target))
            low = mid + 1;
        else if (less(target, s[mid]))
            high = mid - 1;
        else
            return mid;
    }
    return -1;
}

// =========================================================================================================
// Extremes
// =========================================================================================================

/// Throws invalid_argument for empty input
template <contiguous_range R>
[[nodiscard]] element_t<R> most_common(R const& values)
{
    auto const s = as_span(values);
    impl::check_not_empty(s.size(), "most_common");

    auto const counts = impl::count_occurrences(s);
    auto const* best = &counts.front();
    for (auto const& entry : counts)
        if (entry.second > best->second)
            best = &entry;
    return best->first;
}

/// Usage:
///   auto const youngest = ax::min_by(people, [](person const& p) { return p.age; });
template <contiguous_range R, class Key>
[[nodiscard]] std::optional<element_t<R>> min_by(R const& values, Key&& key)
{
    auto const s = as_span(values);
    if (s.empty())
        return std::nullopt;

    isize best = 0;
    auto best_key = key(s[0]);
    for (isize i = 1; i < s.size(); ++i)
    {
        auto k = key(s[i]);
        if (k < best_key)
        {
            best = i;
            best_key = std::move(k);
        }
    }
    return s[best];
}

template <contiguous_range R, class Key>
[[nodiscard]] std::optional<element_t<R>> max_by(R const& values, Key&& key)
{
    auto const s = as_span(values);
    if (s.empty())
        return std::nullopt;

    isize best = 0;
    auto best_key = key(s[0]);
    for (isize i = 1; i < s.size(); ++i)
    {
        auto k = key(s[i]);
        if (best_key < k)
        {
            best = i;
            best_key = std::move(k);
        }
    }
    return s[best];
}

} // namespace ax
