#pragma once

#include <arrayx/assert.hh>
#include <arrayx/fwd.hh>

// =========================================================================================================
// Utility functions shared by the array modules
// =========================================================================================================
//
// Comparison and clamping:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//   clamp(v, lo, hi)            - clamps value v to range [lo, hi] (requires operator<)
//
// Index arithmetic:
//   wrap_index(i, n)            - i modulo n, always in [0, n), also for negative i
//   int_div_round_up(nom, den)  - divide integers and round up (both > 0)
//
// Callable utilities:
//   less_function               - callable that compares with operator<
//   greater_function            - callable that compares with operator> (expressed as b < a)
//
// Template metaprogramming:
//   dont_deduce<T>              - disable template argument deduction for T
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Scope utilities:
//   AX_DEFER { code }           - execute code at scope-exit (RAII cleanup)
//

namespace ax
{
// =========================================================================================================
// Comparison and clamping
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
/// Usage:
///   isize const n = ax::max(count, isize(0));
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a (consistent with max returning b)
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Clamps a value to the range [lo, hi]
/// Precondition: lo <= hi (expressed as !(hi < lo))
/// Usage:
///   isize const take = ax::clamp(count, isize(0), values.size());
template <class T>
[[nodiscard]] constexpr T const& clamp(T const& v, T const& lo, T const& hi)
{
    static_assert(requires { v < lo; }, "T must support operator<");
    AX_ASSERT(!(hi < lo), "clamp: hi must be >= lo");
    return (v < lo) ? lo : (hi < v) ? hi : v; // NOLINT
}

// =========================================================================================================
// Index arithmetic
// =========================================================================================================

/// Euclidean remainder: result is in [0, n) for any i
/// Precondition: n > 0
/// Usage:
///   // wrap_index(7, 5) == 2
///   // wrap_index(-1, 5) == 4
[[nodiscard]] constexpr isize wrap_index(isize i, isize n)
{
    AX_ASSERT(n > 0, "wrap_index: n must be positive");
    auto const r = i % n;
    return r < 0 ? r + n : r;
}

/// Divide integers and round up: ceil(nom / denom)
/// Precondition: nom > 0 && denom > 0
/// Usage:
///   isize chunk_count = int_div_round_up(values.size(), chunk_size);
///   // int_div_round_up(10, 3) == 4
template <class T>
[[nodiscard]] constexpr T int_div_round_up(T nom, T denom)
{
    AX_ASSERT(nom > 0 && denom > 0, "int_div_round_up: both nom and denom must be positive");
    return 1 + ((nom - 1) / denom);
}

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Default ordering of the sort / merge / search operations
struct less_function
{
    template <class A, class B>
    [[nodiscard]] constexpr bool operator()(A const& a, B const& b) const
    {
        return a < b;
    }
};

/// Descending ordering, only needs operator<
struct greater_function
{
    template <class A, class B>
    [[nodiscard]] constexpr bool operator()(A const& a, B const& b) const
    {
        return b < a;
    }
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

namespace impl
{
template <class T>
struct dont_deduce_t
{
    using type = T;
};
} // namespace impl

/// Helper typedef for disabling template argument deduction
/// See https://artificial-mind.net/blog/2020/09/26/dont-deduce
/// Usage:
///   template <class Range>
///   auto append(Range const& values, dont_deduce<element_t<Range>> const& item);
///   // append(ints, 'a') converts 'a' instead of failing deduction
template <class T>
using dont_deduce = typename impl::dont_deduce_t<T>::type;

/// Always evaluates to false, but only after template instantiation
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// Converts a function signature to a function pointer type
///   ax::function_ptr<int(float, double)>  -> int (*)(float, double)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Scope utilities
// =========================================================================================================

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(static_cast<F&&>(f));
}
} // namespace impl

} // namespace ax

/// Execute code at scope-exit (RAII-style cleanup)
/// Captures by reference - be careful with lifetime
/// Usage:
///   auto* ctx = EVP_MD_CTX_new();
///   AX_DEFER { EVP_MD_CTX_free(ctx); };
#define AX_DEFER auto const AX_MACRO_JOIN(_ax_deferred_, __COUNTER__) = ::ax::impl::deferred_tag{} + [&]
