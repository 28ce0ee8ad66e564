#pragma once

#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

// =========================================================================================================
// Input ranges of the generic array operations
// =========================================================================================================
//
// The generic operations are templates over any contiguous range, i.e. anything with .data() and .size():
// std::vector, std::array, std::string, ax::span, ...
// Internally they always work on an ax::span<T const> view of the input, results are owned std::vector<T>.
//
//   contiguous_range<R>   - concept for the above
//   element_t<R>          - element type without cv-qualifiers
//   as_span(r)            - read-only view of the range
//   hashable<T>           - std::hash<T> is usable, enables O(n) set operations
//   equality_comparable   - re-exported std::equality_comparable
//
// Note: std::vector<bool> has no .data() and is not a contiguous range.
//       Use std::array<bool, N>, a braced list (for span<bool const> parameters) or std::vector<char>.

namespace ax
{
template <class R>
concept contiguous_range = requires(R const& r) {
    { r.data() } -> std::convertible_to<void const*>;
    { r.size() } -> std::convertible_to<isize>;
};

template <class R>
using element_t = std::remove_cvref_t<decltype(*std::declval<R const&>().data())>;

template <class R>
[[nodiscard]] constexpr span<element_t<R> const> as_span(R const& r)
{
    return span<element_t<R> const>(r.data(), static_cast<isize>(r.size()));
}

template <class T>
concept hashable = requires(T const& v) {
    { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
};

using std::equality_comparable;
} // namespace ax
