#pragma once

#include <arrayx/fwd.hh>
#include <arrayx/query.hh>
#include <arrayx/range.hh>
#include <arrayx/span.hh>

#include <type_traits>
#include <unordered_set>
#include <vector>

// =========================================================================================================
// Set operations on generic arrays
// =========================================================================================================
//
// All results keep the first-occurrence order of their input and contain no duplicates.
// Element types only need operator==, hashable types take the O(n) path.
//
//   distinct(values)                 - every value once
//   distinct_by(values, key)         - first element for every distinct key
//   remove_duplicates(values)        - same as distinct
//   find_duplicates(values)          - every value that occurs more than once, once
//   find_duplicate_indices(values)   - every index whose value occurs more than once (ascending)
//   intersect(a, b)                  - distinct values of a that occur in b
//   union_of(a, b)                   - distinct values of a, then those of b not in a
//   except(a, b)                     - distinct values of a that do not occur in b
//

namespace ax
{
namespace impl
{
/// Remembers values, insert() reports whether a value is new
template <class T>
struct seen_set
{
    bool insert(T const& v)
    {
        if constexpr (hashable<T>)
            return _values.insert(v).second;
        else
        {
            for (auto const& s : _values)
                if (s == v)
                    return false;
            _values.push_back(v);
            return true;
        }
    }

    [[nodiscard]] bool contains(T const& v) const
    {
        if constexpr (hashable<T>)
            return _values.contains(v);
        else
        {
            for (auto const& s : _values)
                if (s == v)
                    return true;
            return false;
        }
    }

private:
    std::conditional_t<hashable<T>, std::unordered_set<T>, std::vector<T>> _values;
};
} // namespace impl

/// Usage:
///   ax::distinct(std::vector{3, 1, 3, 2, 1})  // {3, 1, 2}
template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> distinct(R const& values)
{
    impl::seen_set<element_t<R>> seen;
    std::vector<element_t<R>> result;
    for (auto const& v : as_span(values))
        if (seen.insert(v))
            result.push_back(v);
    return result;
}

template <contiguous_range R, class Key>
[[nodiscard]] std::vector<element_t<R>> distinct_by(R const& values, Key&& key)
{
    using key_t = std::remove_cvref_t<decltype(key(std::declval<element_t<R> const&>()))>;

    impl::seen_set<key_t> seen;
    std::vector<element_t<R>> result;
    for (auto const& v : as_span(values))
        if (seen.insert(key(v)))
            result.push_back(v);
    return result;
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> remove_duplicates(R const& values)
{
    return distinct(values);
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> find_duplicates(R const& values)
{
    std::vector<element_t<R>> result;
    for (auto const& [value, count] : impl::count_occurrences(as_span(values)))
        if (count > 1)
            result.push_back(value);
    return result;
}

/// Usage:
///   ax::find_duplicate_indices(std::vector{5, 1, 5, 2, 1})  // {0, 1, 2, 4}
template <contiguous_range R>
[[nodiscard]] std::vector<isize> find_duplicate_indices(R const& values)
{
    auto const s = as_span(values);

    impl::seen_set<element_t<R>> duplicated;
    for (auto const& [value, count] : impl::count_occurrences(s))
        if (count > 1)
            duplicated.insert(value);

    std::vector<isize> result;
    for (isize i = 0; i < s.size(); ++i)
        if (duplicated.contains(s[i]))
            result.push_back(i);
    return result;
}

template <contiguous_range A, contiguous_range B>
[[nodiscard]] std::vector<element_t<A>> intersect(A const& a, B const& b)
{
    static_assert(std::is_same_v<element_t<A>, element_t<B>>, "intersect requires equal element types");

    impl::seen_set<element_t<A>> in_b;
    for (auto const& v : as_span(b))
        in_b.insert(v);

    impl::seen_set<element_t<A>> emitted;
    std::vector<element_t<A>> result;
    for (auto const& v : as_span(a))
        if (in_b.contains(v) && emitted.insert(v))
            result.push_back(v);
    return result;
}

template <contiguous_range A, contiguous_range B>
[[nodiscard]] std::vector<element_t<A>> union_of(A const& a, B const& b)
{
    static_assert(std::is_same_v<element_t<A>, element_t<B>>, "union_of requires equal element types");

    impl::seen_set<element_t<A>> emitted;
    std::vector<element_t<A>> result;
    for (auto const& v : as_span(a))
        if (emitted.insert(v))
            result.push_back(v);
    for (auto const& v : as_span(b))
        if (emitted.insert(v))
            result.push_back(v);
    return result;
}

template <contiguous_range A, contiguous_range B>
[[nodiscard]] std::vector<element_t<A>> except(A const& a, B const& b)
{
    static_assert(std::is_same_v<element_t<A>, element_t<B>>, "except requires equal element types");

    impl::seen_set<element_t<A>> in_b;
    for (auto const& v : as_span(b))
        in_b.insert(v);

    impl::seen_set<element_t<A>> emitted;
    std::vector<element_t<A>> result;
    for (auto const& v : as_span(a))
        if (!in_b.contains(v) && emitted.insert(v))
            result.push_back(v);
    return result;
}

} // namespace ax
