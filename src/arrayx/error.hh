#pragma once

#include <arrayx/fwd.hh>
#include <arrayx/macros.hh>
#include <arrayx/source_location.hh>

#include <exception>
#include <string>

// =========================================================================================================
// Caller-visible failures of array operations
// =========================================================================================================
//
// Every public operation validates its arguments up front and throws ax::error on violation.
// Nothing is retried and no partial result is produced: the call simply does not happen.
// Internal invariants are guarded by AX_ASSERT instead (see <arrayx/assert.hh>).
//
// Kinds:
//   invalid_argument    - a collection is empty where at least one element is required,
//                         or an argument is malformed (end <= start, bad hex text, corrupt gzip data)
//   index_out_of_range  - a position (index, slice start/end, row/column) is outside the sequence
//   value_out_of_range  - a bounded parameter is outside its documented interval
//                         (percentile 0..100, nth occurrence 1..5, bit shift 0..7, GUID version 1..5, sizes > 0)
//   length_mismatch     - paired sequences (bitwise ops, correlation, zip_exact) differ in length
//
// Usage:
//   try
//   {
//       auto const m = ax::median(values);
//   }
//   catch (ax::error const& e)
//   {
//       if (e.kind() == ax::error_kind::invalid_argument)
//           std::cerr << e.to_string();
//   }

enum class ax::error_kind
{
    invalid_argument,
    index_out_of_range,
    value_out_of_range,
    length_mismatch,
};

/// Exception thrown by arrayx operations on invalid arguments.
/// Carries the failure kind, a message naming the operation, and the site of the failing check.
struct ax::error : std::exception
{
    error(error_kind kind, std::string message, ax::source_location site = ax::source_location::current());

    [[nodiscard]] error_kind kind() const { return _kind; }
    [[nodiscard]] std::string const& message() const { return _message; }
    [[nodiscard]] ax::source_location site() const { return _site; }

    [[nodiscard]] char const* what() const noexcept override { return _message.c_str(); }

    /// Multi-line report:
    ///   error: index_out_of_range: slice: start 7 is outside [0, 5)
    ///     at src/arrayx/structure.hh:120 - slice
    [[nodiscard]] std::string to_string() const;

private:
    error_kind _kind;
    std::string _message;
    ax::source_location _site;
};

namespace ax
{
/// Name of an error kind, e.g. "index_out_of_range".
[[nodiscard]] char const* to_string(error_kind kind);
} // namespace ax

// =========================================================================================================
// Argument checks
// =========================================================================================================
//
// Used at the top of every public operation. The fast path is inline, the throw is out of line.
// "operation" is the public name of the calling function and prefixes the message.

namespace ax::impl
{
[[noreturn]] AX_COLD_FUNC void raise_error(error_kind kind, std::string message, ax::source_location site);

[[noreturn]] AX_COLD_FUNC void raise_empty(char const* operation, ax::source_location site);
[[noreturn]] AX_COLD_FUNC void raise_index(char const* operation, char const* what, isize index, isize lo, isize hi, ax::source_location site);
[[noreturn]] AX_COLD_FUNC void raise_value(char const* operation, char const* what, double value, double lo, double hi, ax::source_location site);
[[noreturn]] AX_COLD_FUNC void raise_below(char const* operation, char const* what, isize value, isize lo, ax::source_location site);
[[noreturn]] AX_COLD_FUNC void raise_length(char const* operation, isize lhs, isize rhs, ax::source_location site);

/// size > 0, otherwise invalid_argument
inline void check_not_empty(isize size, char const* operation, ax::source_location site = ax::source_location::current())
{
    if (size <= 0) [[unlikely]]
        raise_empty(operation, site);
}

/// lo <= index < hi, otherwise index_out_of_range
inline void check_index(isize index, isize lo, isize hi, char const* operation, char const* what = "index",
                        ax::source_location site = ax::source_location::current())
{
    if (index < lo || index >= hi) [[unlikely]]
        raise_index(operation, what, index, lo, hi, site);
}

/// lo <= value <= hi, otherwise value_out_of_range
inline void check_value(double value, double lo, double hi, char const* operation, char const* what,
                        ax::source_location site = ax::source_location::current())
{
    // written so that NaN fails the check
    if (!(lo <= value && value <= hi)) [[unlikely]]
        raise_value(operation, what, value, lo, hi, site);
}

/// value >= lo, otherwise value_out_of_range
/// Used for sizes and counts: check_at_least(size, 1, "chunk", "size")
inline void check_at_least(isize value, isize lo, char const* operation, char const* what,
                           ax::source_location site = ax::source_location::current())
{
    if (value < lo) [[unlikely]]
        raise_below(operation, what, value, lo, site);
}

/// lhs == rhs, otherwise length_mismatch
inline void check_same_length(isize lhs, isize rhs, char const* operation, ax::source_location site = ax::source_location::current())
{
    if (lhs != rhs) [[unlikely]]
        raise_length(operation, lhs, rhs, site);
}
} // namespace ax::impl
