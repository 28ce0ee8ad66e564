#pragma once

#include <arrayx/assert.hh>
#include <arrayx/fwd.hh>
#include <arrayx/utility.hh>

#include <functional>
#include <type_traits>
#include <utility>

/// Non-owning reference to a callable object with signature T
///
/// Used where a compiled (non-template) array operation takes a callback,
/// currently ax::aggregate(strings, fn) on string arrays.
///
/// IMPORTANT LIFETIME RULE:
///   function_ref never owns. Any referenced callable object must outlive the function_ref.
///   Passing a lambda as a direct argument is always fine.
///
/// Usage example:
///   std::string aggregate(span<std::string const> values, ax::function_ref<std::string(std::string const&, std::string const&)> fn);
///
///   auto const joined = ax::aggregate(words, [](auto const& acc, auto const& s) { return acc + "-" + s; });
///
/// Properties:
///   - Trivially copyable (no destructor, no heap allocations)
///   - Default constructible (creates invalid/null state)
template <class R, class... Args>
struct ax::function_ref<R(Args...)>
{
    // internal storage
private:
    void* _payload = nullptr;
    ax::function_ptr<R(void*, Args...)> _thunk = nullptr;

    // construction
public:
    /// default constructor creates an invalid/null function_ref
    function_ref() = default;

    /// construct from any callable
    /// accepts all kinds of references because it must not outlive its arg anyways
    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref>)
    function_ref(F&& f) : _payload(const_cast<void*>(static_cast<void const*>(&f)))
    {
        static_assert(std::is_invocable_r_v<R, F&, Args...>, "F must be callable with Args... and return R");

        using Fn = std::remove_reference_t<F>;
        // NOLINTBEGIN
        _thunk = [](void* p, Args... args) -> R { return std::invoke(*static_cast<Fn*>(p), std::forward<Args>(args)...); };
        // NOLINTEND
    }

    // copy and move (trivial, compiler-generated)
public:
    function_ref(function_ref const&) = default;
    function_ref(function_ref&&) = default;
    function_ref& operator=(function_ref const&) = default;
    function_ref& operator=(function_ref&&) = default;
    ~function_ref() = default;

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _thunk != nullptr; }
    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    // invocation
public:
    /// precondition: is_valid()
    R operator()(Args... args) const
    {
        AX_ASSERT(_thunk != nullptr, "calling invalid function_ref is UB");
        return _thunk(_payload, std::forward<Args>(args)...);
    }
};
