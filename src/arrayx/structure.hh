#pragma once

#include <arrayx/error.hh>
#include <arrayx/fwd.hh>
#include <arrayx/range.hh>
#include <arrayx/span.hh>
#include <arrayx/utility.hh>

#include <limits>
#include <optional>
#include <type_traits>
#include <vector>

// =========================================================================================================
// Structural operations on generic arrays
// =========================================================================================================
//
// All operations take any contiguous range (see <arrayx/range.hh>) and return a new std::vector,
// the input is never modified. Exceptions are fill (in place) and safe_set (grows a vector).
//
// Adding and removing:
//   append(values, item)                   - copy with item at the end
//   append_range(values, items)            - copy with all items at the end
//   insert_at(values, index, item)         - copy with item at index, 0 <= index <= n
//   remove_at(values, index)               - copy without the element at index, 0 <= index < n
//
// Reordering:
//   rotate_left(values, k)                 - element k moves to the front (k modulo n, negative rotates right)
//   rotate_right(values, k)                - last k elements move to the front
//   reverse(values)                        - reversed copy
//   interleave(a, b)                       - a0 b0 a1 b1 ... then the rest of the longer one
//   merge(a, b, less)                      - stable merge of two sorted ranges, ties take from a
//
// Splitting:
//   chunk(values, size)                    - consecutive pieces of size, last one may be shorter
//   batch(values, size)                    - same as chunk
//   sliding_window(values, size)           - every window of size consecutive elements
//   slice(values, start[, end])            - copy of [start, end)
//   first_n(values, n) / last_n(values, n) - up to n elements from the front / back
//   head(values) / tail(values)            - first element (optional) / everything after it
//
// Whole-array:
//   resize(values, n)                      - first n elements, padded with T{}
//   fill(values, v)                        - IN PLACE, assigns v to every element
//   safe_get(values, i, fallback)          - values[i] or fallback if i is out of range
//   safe_set(vector, i, v)                 - IN PLACE, grows the vector if needed
//   replace_all(values, old, new)          - copy with every old replaced by new
//   flatten(nested)                        - concatenation of inner ranges
//   remove_nulls(values) / any_null(values)- for pointer-like elements
//
// Errors:
//   index_out_of_range  - insert_at, remove_at, slice, safe_set with bad positions
//   invalid_argument    - slice with end <= start
//   value_out_of_range  - chunk/batch/sliding_window size <= 0, resize with n < 0
//

namespace ax
{
template <class R>
concept mutable_contiguous_range = contiguous_range<R> && requires(R& r) {
    requires !std::is_const_v<std::remove_reference_t<decltype(*r.data())>>;
};

// =========================================================================================================
// Adding and removing
// =========================================================================================================

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> append(R const& values, dont_deduce<element_t<R>> const& item)
{
    auto const s = as_span(values);
    std::vector<element_t<R>> result;
    result.reserve(s.size() + 1);
    result.insert(result.end(), s.begin(), s.end());
    result.push_back(item);
    return result;
}

template <contiguous_range R, contiguous_range Items>
[[nodiscard]] std::vector<element_t<R>> append_range(R const& values, Items const& items)
{
    static_assert(std::is_convertible_v<element_t<Items>, element_t<R>>, "items must convert to the element type");
    auto const s = as_span(values);
    auto const extra = as_span(items);
    std::vector<element_t<R>> result;
    result.reserve(s.size() + extra.size());
    result.insert(result.end(), s.begin(), s.end());
    result.insert(result.end(), extra.begin(), extra.end());
    return result;
}

/// Usage:
///   ax::insert_at(std::vector{1, 2, 3}, 3, 4)  // {1, 2, 3, 4}, inserting at n appends
template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> insert_at(R const& values, isize index, dont_deduce<element_t<R>> const& item)
{
    auto const s = as_span(values);
    impl::check_index(index, 0, s.size() + 1, "insert_at");

    std::vector<element_t<R>> result;
    result.reserve(s.size() + 1);
    result.insert(result.end(), s.begin(), s.begin() + index);
    result.push_back(item);
    result.insert(result.end(), s.begin() + index, s.end());
    return result;
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> remove_at(R const& values, isize index)
{
    auto const s = as_span(values);
    impl::check_index(index, 0, s.size(), "remove_at");

    std::vector<element_t<R>> result;
    result.reserve(s.size() - 1);
    result.insert(result.end(), s.begin(), s.begin() + index);
    result.insert(result.end(), s.begin() + index + 1, s.end());
    return result;
}

// =========================================================================================================
// Reordering
// =========================================================================================================

/// result[i] = values[(i + k) mod n]
/// Usage:
///   ax::rotate_left(std::vector{1, 2, 3, 4, 5}, 2)  // {3, 4, 5, 1, 2}
///   ax::rotate_left(std::vector{1, 2, 3, 4, 5}, 7)  // same, k is taken modulo n
template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> rotate_left(R const& values, isize k)
{
    auto const s = as_span(values);
    if (s.empty())
        return {};

    auto const shift = wrap_index(k, s.size());
    std::vector<element_t<R>> result;
    result.reserve(s.size());
    result.insert(result.end(), s.begin() + shift, s.end());
    result.insert(result.end(), s.begin(), s.begin() + shift);
    return result;
}

/// Inverse of rotate_left: rotate_right(rotate_left(v, k), k) == v
/// Usage:
///   ax::rotate_right(std::vector{1, 2, 3, 4, 5}, 2)  // {4, 5, 1, 2, 3}
template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> rotate_right(R const& values, isize k)
{
    auto const s = as_span(values);
    if (s.empty())
        return {};

    // right by k == left by n - (k mod n), without negating k
    auto const shift = wrap_index(k, s.size());
    return rotate_left(s, shift == 0 ? 0 : s.size() - shift);
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> reverse(R const& values)
{
    auto const s = as_span(values);
    std::vector<element_t<R>> result;
    result.reserve(s.size());
    for (auto i = s.size() - 1; i >= 0; --i)
        result.push_back(s[i]);
    return result;
}

template <contiguous_range A, contiguous_range B>
[[nodiscard]] std::vector<element_t<A>> interleave(A const& a, B const& b)
{
    static_assert(std::is_same_v<element_t<A>, element_t<B>>, "interleave requires equal element types");
    auto const sa = as_span(a);
    auto const sb = as_span(b);

    std::vector<element_t<A>> result;
    result.reserve(sa.size() + sb.size());

    auto const common = min(sa.size(), sb.size());
    for (isize i = 0; i < common; ++i)
    {
        result.push_back(sa[i]);
        result.push_back(sb[i]);
    }
    result.insert(result.end(), sa.begin() + common, sa.end());
    result.insert(result.end(), sb.begin() + common, sb.end());
    return result;
}

/// Both inputs must be sorted by less. On ties the element of a comes first.
template <contiguous_range A, contiguous_range B, class Less = less_function>
[[nodiscard]] std::vector<element_t<A>> merge(A const& a, B const& b, Less&& less = {})
{
    static_assert(std::is_same_v<element_t<A>, element_t<B>>, "merge requires equal element types");
    auto const sa = as_span(a);
    auto const sb = as_span(b);

    std::vector<element_t<A>> result;
    result.reserve(sa.size() + sb.size());

    isize i = 0;
    isize j = 0;
    while (i < sa.size() && j < sb.size())
    {
        if (less(sb[j], sa[i]))
            result.push_back(sb[j++]);
        else
            result.push_back(sa[i++]);
    }
    result.insert(result.end(), sa.begin() + i, sa.end());
    result.insert(result.end(), sb.begin() + j, sb.end());
    return result;
}

// =========================================================================================================
// Splitting
// =========================================================================================================

/// Usage:
///   ax::chunk(std::vector{1, 2, 3, 4, 5}, 2)  // {{1, 2}, {3, 4}, {5}}
template <contiguous_range R>
[[nodiscard]] std::vector<std::vector<element_t<R>>> chunk(R const& values, isize size)
{
    impl::check_at_least(size, 1, "chunk", "size");
    auto const s = as_span(values);

    std::vector<std::vector<element_t<R>>> result;
    if (s.empty())
        return result;

    result.reserve(int_div_round_up(s.size(), size));
    for (isize start = 0; start < s.size(); start += size)
    {
        auto const piece = s.subspan(start, min(size, s.size() - start));
        result.emplace_back(piece.begin(), piece.end());
    }
    return result;
}

template <contiguous_range R>
[[nodiscard]] std::vector<std::vector<element_t<R>>> batch(R const& values, isize size)
{
    impl::check_at_least(size, 1, "batch", "size");
    return chunk(values, size);
}

/// n - size + 1 windows, none if size > n
template <contiguous_range R>
[[nodiscard]] std::vector<std::vector<element_t<R>>> sliding_window(R const& values, isize size)
{
    impl::check_at_least(size, 1, "sliding_window", "size");
    auto const s = as_span(values);

    std::vector<std::vector<element_t<R>>> result;
    if (size > s.size())
        return result;

    result.reserve(s.size() - size + 1);
    for (isize start = 0; start + size <= s.size(); ++start)
    {
        auto const window = s.subspan(start, size);
        result.emplace_back(window.begin(), window.end());
    }
    return result;
}

/// Copy of [start, n)
/// start must be a valid index, so slicing an empty range always fails
template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> slice(R const& values, isize start)
{
    auto const s = as_span(values);
    impl::check_index(start, 0, s.size(), "slice", "start");
    auto const piece = s.subspan(start);
    return std::vector<element_t<R>>(piece.begin(), piece.end());
}

/// Copy of the half-open range [start, end)
/// Usage:
///   ax::slice(std::vector{1, 2, 3, 4, 5}, 1, 4)   // {2, 3, 4}
///   ax::slice(std::vector{1, 2, 3, 4, 5}, -1, 4)  // throws index_out_of_range
///   ax::slice(std::vector{1, 2, 3, 4, 5}, 4, 2)   // throws invalid_argument
template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> slice(R const& values, isize start, isize end)
{
    auto const s = as_span(values);
    impl::check_index(start, 0, s.size(), "slice", "start");
    if (end <= start)
        impl::raise_error(error_kind::invalid_argument, "slice: end must be greater than start", ax::source_location::current());
    impl::check_index(end, 0, s.size() + 1, "slice", "end");

    auto const piece = s.subspan(start, end - start);
    return std::vector<element_t<R>>(piece.begin(), piece.end());
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> first_n(R const& values, isize n)
{
    auto const s = as_span(values);
    auto const piece = s.first(clamp(n, isize(0), s.size()));
    return std::vector<element_t<R>>(piece.begin(), piece.end());
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> last_n(R const& values, isize n)
{
    auto const s = as_span(values);
    auto const piece = s.last(clamp(n, isize(0), s.size()));
    return std::vector<element_t<R>>(piece.begin(), piece.end());
}

template <contiguous_range R>
[[nodiscard]] std::optional<element_t<R>> head(R const& values)
{
    auto const s = as_span(values);
    if (s.empty())
        return std::nullopt;
    return s.front();
}

/// Everything but the first element, empty for empty input
template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> tail(R const& values)
{
    auto const s = as_span(values);
    if (s.empty())
        return {};
    auto const rest = s.subspan(1);
    return std::vector<element_t<R>>(rest.begin(), rest.end());
}

// =========================================================================================================
// Whole-array
// =========================================================================================================

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> resize(R const& values, isize n)
{
    impl::check_at_least(n, 0, "resize", "new size");
    auto const s = as_span(values);
    auto const kept = s.first(min(n, s.size()));

    std::vector<element_t<R>> result(kept.begin(), kept.end());
    result.resize(n);
    return result;
}

/// Assigns v to every element IN PLACE
/// Usage:
///   std::vector<int> v(4);
///   ax::fill(v, 7);
///   ax::fill(ax::span<int>(v).subspan(1, 2), 0);  // partial fill through a view
template <class R>
    requires mutable_contiguous_range<R>
void fill(R&& values, dont_deduce<element_t<R>> const& v)
{
    auto* const data = values.data();
    auto const n = static_cast<isize>(values.size());
    for (isize i = 0; i < n; ++i)
        data[i] = v;
}

template <contiguous_range R>
[[nodiscard]] element_t<R> safe_get(R const& values, isize index, dont_deduce<element_t<R>> const& fallback = {})
{
    auto const s = as_span(values);
    if (index < 0 || index >= s.size())
        return fallback;
    return s[index];
}

/// Sets values[index] IN PLACE, growing the vector with T{} when index >= size
template <class T>
void safe_set(std::vector<T>& values, isize index, dont_deduce<T> const& v)
{
    impl::check_index(index, 0, std::numeric_limits<isize>::max(), "safe_set");
    if (index >= isize(values.size()))
        values.resize(index + 1);
    values[index] = v;
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> replace_all(R const& values, dont_deduce<element_t<R>> const& old_value,
                                                    dont_deduce<element_t<R>> const& new_value)
{
    std::vector<element_t<R>> result;
    result.reserve(values.size());
    for (auto const& v : as_span(values))
        result.push_back(v == old_value ? new_value : v);
    return result;
}

/// Usage:
///   std::vector<std::vector<int>> nested = {{1, 2}, {}, {3}};
///   ax::flatten(nested)  // {1, 2, 3}
template <contiguous_range R>
    requires contiguous_range<element_t<R>>
[[nodiscard]] std::vector<element_t<element_t<R>>> flatten(R const& nested)
{
    std::vector<element_t<element_t<R>>> result;
    isize total = 0;
    for (auto const& inner : as_span(nested))
        total += static_cast<isize>(inner.size());
    result.reserve(total);

    for (auto const& inner : as_span(nested))
    {
        auto const s = as_span(inner);
        result.insert(result.end(), s.begin(), s.end());
    }
    return result;
}

template <contiguous_range R>
    requires requires(element_t<R> const& v) { v == nullptr; }
[[nodiscard]] std::vector<element_t<R>> remove_nulls(R const& values)
{
    std::vector<element_t<R>> result;
    for (auto const& v : as_span(values))
        if (!(v == nullptr))
            result.push_back(v);
    return result;
}

template <contiguous_range R>
    requires requires(element_t<R> const& v) { v == nullptr; }
[[nodiscard]] bool any_null(R const& values)
{
    for (auto const& v : as_span(values))
        if (v == nullptr)
            return true;
    return false;
}

} // namespace ax
