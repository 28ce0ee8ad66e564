#include "error.hh"

#include <cmath>
#include <cstdio>
#include <utility>

namespace
{
// shortest round-trippable form for integral values, %g otherwise
std::string number_to_string(double v)
{
    if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 1e15)
        return std::to_string(static_cast<long long>(v));

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%g", v);
    return buffer;
}
} // namespace

ax::error::error(error_kind kind, std::string message, ax::source_location site)
  : _kind(kind), _message(std::move(message)), _site(site)
{
}

std::string ax::error::to_string() const
{
    std::string result;

    result += "error: ";
    result += ax::to_string(_kind);
    result += ": ";
    result += _message;
    result += "\n";

    result += "  at ";
    result += _site.file_name();
    result += ":";
    result += std::to_string(_site.line());
    result += " - ";
    result += _site.function_name();
    result += "\n";

    return result;
}

char const* ax::to_string(error_kind kind)
{
    switch (kind)
    {
    case error_kind::invalid_argument:
        return "invalid_argument";
    case error_kind::index_out_of_range:
        return "index_out_of_range";
    case error_kind::value_out_of_range:
        return "value_out_of_range";
    case error_kind::length_mismatch:
        return "length_mismatch";
    }
    return "<unknown error_kind>";
}

void ax::impl::raise_error(error_kind kind, std::string message, ax::source_location site)
{
    throw ax::error(kind, std::move(message), site);
}

void ax::impl::raise_empty(char const* operation, ax::source_location site)
{
    std::string msg = operation;
    msg += ": sequence must not be empty";
    raise_error(error_kind::invalid_argument, std::move(msg), site);
}

void ax::impl::raise_index(char const* operation, char const* what, isize index, isize lo, isize hi, ax::source_location site)
{
    std::string msg = operation;
    msg += ": ";
    msg += what;
    msg += " ";
    msg += std::to_string(index);
    msg += " is outside [";
    msg += std::to_string(lo);
    msg += ", ";
    msg += std::to_string(hi);
    msg += ")";
    raise_error(error_kind::index_out_of_range, std::move(msg), site);
}

void ax::impl::raise_value(char const* operation, char const* what, double value, double lo, double hi, ax::source_location site)
{
    std::string msg = operation;
    msg += ": ";
    msg += what;
    msg += " ";
    msg += number_to_string(value);
    msg += " must be in [";
    msg += number_to_string(lo);
    msg += ", ";
    msg += number_to_string(hi);
    msg += "]";
    raise_error(error_kind::value_out_of_range, std::move(msg), site);
}

void ax::impl::raise_below(char const* operation, char const* what, isize value, isize lo, ax::source_location site)
{
    std::string msg = operation;
    msg += ": ";
    msg += what;
    msg += " ";
    msg += std::to_string(value);
    msg += " must be at least ";
    msg += std::to_string(lo);
    raise_error(error_kind::value_out_of_range, std::move(msg), site);
}

void ax::impl::raise_length(char const* operation, isize lhs, isize rhs, ax::source_location site)
{
    std::string msg = operation;
    msg += ": sequences must have the same length (";
    msg += std::to_string(lhs);
    msg += " vs. ";
    msg += std::to_string(rhs);
    msg += ")";
    raise_error(error_kind::length_mismatch, std::move(msg), site);
}
