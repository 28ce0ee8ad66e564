#pragma once

#include <arrayx/error.hh>
#include <arrayx/fwd.hh>
#include <arrayx/range.hh>
#include <arrayx/span.hh>
#include <arrayx/utility.hh>

#include <random>
#include <utility>
#include <vector>

// =========================================================================================================
// Randomized operations on generic arrays
// =========================================================================================================
//
// Every operation takes the random engine as a parameter (any std::uniform_random_bit_generator).
// Pass a seeded engine for reproducible results:
//
//   std::mt19937_64 rng(42);
//   auto const a = ax::shuffle(values, rng);
//
// The overloads without an engine create a fresh, nondeterministically seeded engine per call.
// No engine is shared between calls, so these are safe to call from multiple threads.
//
//   shuffle(values[, rng])               - uniformly shuffled copy (Fisher-Yates)
//   random_sample(values, count[, rng])  - count distinct positions in random order, count clamped to n
//
// For cryptographically secure bytes see ax::secure_random_bytes in <arrayx/bytes.hh>.
//

namespace ax
{
namespace impl
{
/// seeded from std::random_device, never reused
[[nodiscard]] inline std::mt19937_64 fresh_engine()
{
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    return std::mt19937_64(seed);
}

/// Moves a uniformly chosen selection of `count` elements into items[0, count) (partial Fisher-Yates)
template <class T, std::uniform_random_bit_generator Rng>
void partial_shuffle(std::vector<T>& items, isize count, Rng& rng)
{
    auto const n = isize(items.size());
    for (isize i = 0; i < count && i < n - 1; ++i)
    {
        std::uniform_int_distribution<isize> pick(i, n - 1);
        auto const j = pick(rng);
        if (j != i)
            std::swap(items[i], items[j]);
    }
}
} // namespace impl

template <contiguous_range R, std::uniform_random_bit_generator Rng>
[[nodiscard]] std::vector<element_t<R>> shuffle(R const& values, Rng& rng)
{
    auto const s = as_span(values);
    std::vector<element_t<R>> result(s.begin(), s.end());
    impl::partial_shuffle(result, isize(result.size()), rng);
    return result;
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> shuffle(R const& values)
{
    auto rng = impl::fresh_engine();
    return ax::shuffle(values, rng);
}

/// Elements from min(count, n) distinct positions
/// Throws value_out_of_range for count < 0
template <contiguous_range R, std::uniform_random_bit_generator Rng>
[[nodiscard]] std::vector<element_t<R>> random_sample(R const& values, isize count, Rng& rng)
{
    impl::check_at_least(count, 0, "random_sample", "count");
    auto const s = as_span(values);
    auto const take = min(count, s.size());

    std::vector<element_t<R>> result(s.begin(), s.end());
    impl::partial_shuffle(result, take, rng);
    result.resize(take);
    return result;
}

template <contiguous_range R>
[[nodiscard]] std::vector<element_t<R>> random_sample(R const& values, isize count)
{
    auto rng = impl::fresh_engine();
    return ax::random_sample(values, count, rng);
}

} // namespace ax
