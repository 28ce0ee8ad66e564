#pragma once

#include <arrayx/bit.hh>
#include <arrayx/error.hh>
#include <arrayx/fwd.hh>
#include <arrayx/range.hh>
#include <arrayx/span.hh>

#include <type_traits>
#include <utility>
#include <vector>

// -----------------------------------------------------------------------------
// permutation & subset enumeration
// -----------------------------------------------------------------------------

// 1) Enumeration is internal iteration: the visitor is called once per result.
//    for_each_* never materializes more than one result at a time.

// 2) The visitor receives a span<T const> that is only valid during the call.
//    Copy it if it has to outlive the visit.

// 3) step may return void or bool.
//    - void => never early-out
//    - bool => true triggers early stop

// 4) for_each_* returns visit_outcome:
//    - empty      : nothing was visited
//    - stopped    : step returned true
//    - completed  : every result was visited

// 5) permutations / subsets collect every result into a vector.
//    Both are n! / 2^n in size: the caller is responsible for keeping n small.
//    Subsets additionally reject n > 62 because the bitmask would overflow.

// 6) Permutations use Heap's algorithm on a private copy of the input.
//    Order for {1, 2, 3}: 123, 213, 312, 132, 231, 321.
//    Empty input has no permutations.

// 7) Subset i contains element j iff bit j of i is set, i = 0 .. 2^n - 1.
//    Empty input has exactly one subset: the empty one.

namespace ax
{
enum class visit_outcome
{
    // nothing was visited
    empty,
    // step function returned true, enumeration was stopped
    stopped,
    // step function never returned true, everything was visited
    completed,
};

namespace impl
{
// true means "stop"
template <class Step, class... Args>
bool call_step(Step& step, Args&&... args)
{
    using result_t = decltype(step(std::forward<Args>(args)...));
    if constexpr (std::is_void_v<result_t>)
    {
        step(std::forward<Args>(args)...);
        return false;
    }
    else
    {
        static_assert(std::is_convertible_v<result_t, bool>, "step must return void or bool");
        return static_cast<bool>(step(std::forward<Args>(args)...));
    }
}

template <class T, class Step>
bool heap_permute(std::vector<T>& items, isize count, Step& step)
{
    if (count <= 1)
        return call_step(step, span<T const>(items.data(), isize(items.size())));

    for (isize i = 0; i < count; ++i)
    {
        if (heap_permute(items, count - 1, step))
            return true;

        if (i == count - 1)
            break;

        if (count % 2 == 0)
            std::swap(items[i], items[count - 1]);
        else
            std::swap(items[0], items[count - 1]);
    }
    return false;
}

inline constexpr isize max_subset_input_size = 62;
} // namespace impl

/// Calls step(span<T const>) for each of the n! orderings of values
/// Usage:
///   ax::for_each_permutation(std::vector{1, 2, 3}, [&](ax::span<int const> p) { print(p); });
///
///   // stop at the first permutation starting with 3
///   auto const outcome = ax::for_each_permutation(values, [](auto p) { return p[0] == 3; });
template <contiguous_range R, class Step>
visit_outcome for_each_permutation(R const& values, Step&& step)
{
    auto const s = as_span(values);
    if (s.empty())
        return visit_outcome::empty;

    std::vector<element_t<R>> items(s.begin(), s.end());
    return impl::heap_permute(items, isize(items.size()), step) ? visit_outcome::stopped : visit_outcome::completed;
}

template <contiguous_range R>
[[nodiscard]] std::vector<std::vector<element_t<R>>> permutations(R const& values)
{
    std::vector<std::vector<element_t<R>>> result;
    for_each_permutation(values, [&](span<element_t<R> const> p) { result.emplace_back(p.begin(), p.end()); });
    return result;
}

/// Calls step(span<T const>) for each of the 2^n subsets of values, in bitmask order
/// Throws value_out_of_range if values has more than 62 elements.
template <contiguous_range R, class Step>
visit_outcome for_each_subset(R const& values, Step&& step)
{
    auto const s = as_span(values);
    impl::check_value(double(s.size()), 0, double(impl::max_subset_input_size), "for_each_subset", "input size");

    auto const mask_end = u64(1) << s.size();

    std::vector<element_t<R>> subset;
    subset.reserve(s.size());
    for (u64 mask = 0; mask < mask_end; ++mask)
    {
        subset.clear();
        for (isize j = 0; j < s.size(); ++j)
            if (has_bit(mask, int(j)))
                subset.push_back(s[j]);

        if (impl::call_step(step, span<element_t<R> const>(subset.data(), isize(subset.size()))))
            return visit_outcome::stopped;
    }
    return visit_outcome::completed;
}

/// Usage:
///   ax::subsets(std::vector{1, 2})  // {{}, {1}, {2}, {1, 2}}
template <contiguous_range R>
[[nodiscard]] std::vector<std::vector<element_t<R>>> subsets(R const& values)
{
    std::vector<std::vector<element_t<R>>> result;
    for_each_subset(values, [&](span<element_t<R> const> p) { result.emplace_back(p.begin(), p.end()); });
    return result;
}

} // namespace ax
