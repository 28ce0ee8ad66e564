#pragma once

#include <arrayx/assert.hh>
#include <arrayx/fwd.hh>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T.
/// Stores a pointer and runtime size.
/// Trivially copyable regardless of T's triviality.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the span.
///
/// All read-only array operations take span<T const>.
/// Any container with .data() and .size() converts implicitly to a const span,
/// mutable spans must be created explicitly.
///
/// Usage:
///   std::vector<double> v = {1, 2, 3};
///   auto const m = ax::mean(v);         // vector -> span<f64 const>
///   auto const s = ax::mean({1., 2.});  // braced list, safe as direct argument
///   ax::fill(ax::span<int>(buffer), 0);  // mutable view is explicit
template <class T>
struct ax::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        AX_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing [begin, end).
    /// Precondition: begin <= end.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        AX_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Creates a span from an initializer_list.
    /// Only available when T is const; allows calling foo({1, 2, 3}) for foo(span<int const>).
    /// WARNING: initializer_list temporaries are destroyed at the end of the full expression.
    /// Safe ONLY as an immediate function argument: foo({1, 2, 3}).
    /// NEVER assign to a variable: auto s = span<int const>{1, 2, 3}; // DANGLING!
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Creates a span from any container providing .data() and .size().
    /// Implicit for const views (read-only arguments), explicit for mutable ones.
    /// The container must outlive the span.
    /// Passing a temporary container is safe when the span is used immediately (e.g., function argument).
    template <class Container>
        requires(!std::is_same_v<std::remove_cvref_t<Container>, span>) && requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit(!std::is_const_v<T>) span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    /// span<T> -> span<T const>
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<U const, T> && !std::is_const_v<U>)
    constexpr span(span<U> other) : _data(other.data()), _size(other.size())
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        AX_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        AX_ASSERT(_size > 0, "front() called on empty span");
        return _data[0];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        AX_ASSERT(_size > 0, "back() called on empty span");
        return _data[_size - 1];
    }

    /// May be nullptr if the span is default-constructed or empty.
    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // subviews
public:
    /// View of [offset, offset + count).
    /// Precondition: 0 <= offset, 0 <= count, offset + count <= size().
    [[nodiscard]] constexpr span subspan(isize offset, isize count) const
    {
        AX_ASSERT(0 <= offset && 0 <= count && offset + count <= _size, "subspan out of bounds");
        return span(_data + offset, count);
    }

    /// View of [offset, size()).
    [[nodiscard]] constexpr span subspan(isize offset) const
    {
        AX_ASSERT(0 <= offset && offset <= _size, "subspan out of bounds");
        return span(_data + offset, _size - offset);
    }

    /// The first n elements.
    [[nodiscard]] constexpr span first(isize n) const
    {
        AX_ASSERT(0 <= n && n <= _size, "first() out of bounds");
        return span(_data, n);
    }

    /// The last n elements.
    [[nodiscard]] constexpr span last(isize n) const
    {
        AX_ASSERT(0 <= n && n <= _size, "last() out of bounds");
        return span(_data + (_size - n), n);
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};

// deduction guides
namespace ax
{
template <class T, std::size_t N>
span(T (&)[N]) -> span<T>;

// Container may be deduced as const, which yields a const view
template <class Container>
span(Container&) -> span<std::remove_pointer_t<decltype(std::declval<Container&>().data())>>;
} // namespace ax
