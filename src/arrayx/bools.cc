#include "bools.hh"

#include <arrayx/error.hh>

#include <algorithm>

namespace
{
ax::isize count_equal(ax::span<bool const> values, bool v)
{
    return ax::isize(std::count(values.begin(), values.end(), v));
}

std::vector<ax::isize> indices_of(ax::span<bool const> values, bool v)
{
    std::vector<ax::isize> result;
    for (ax::isize i = 0; i < values.size(); ++i)
        if (values[i] == v)
            result.push_back(i);
    return result;
}

ax::isize first_index_of(ax::span<bool const> values, bool v)
{
    for (ax::isize i = 0; i < values.size(); ++i)
        if (values[i] == v)
            return i;
    return -1;
}

ax::isize last_index_of(ax::span<bool const> values, bool v)
{
    for (auto i = values.size() - 1; i >= 0; --i)
        if (values[i] == v)
            return i;
    return -1;
}

ax::f64 percentage_of(ax::span<bool const> values, bool v)
{
    if (values.empty())
        return 0;
    return ax::f64(count_equal(values, v)) / ax::f64(values.size()) * 100;
}

template <class Op>
std::vector<bool> combine(ax::span<bool const> a, ax::span<bool const> b, char const* operation, Op op)
{
    ax::impl::check_same_length(a.size(), b.size(), operation);

    std::vector<bool> result(a.size());
    for (ax::isize i = 0; i < a.size(); ++i)
        result[i] = op(a[i], b[i]);
    return result;
}

std::vector<ax::bool_run> runs_of(ax::span<bool const> values, bool v)
{
    std::vector<ax::bool_run> runs;
    ax::bool_run current;
    for (ax::isize i = 0; i < values.size(); ++i)
    {
        if (values[i] == v)
        {
            if (current.length == 0)
                current.start = i;
            ++current.length;
        }
        else if (current.length > 0)
        {
            runs.push_back(current);
            current = {};
        }
    }
    if (current.length > 0)
        runs.push_back(current);
    return runs;
}

ax::bool_run longest_run_of(ax::span<bool const> values, bool v)
{
    ax::bool_run best;
    for (auto const& r : runs_of(values, v))
        if (r.length > best.length)
            best = r;
    return best;
}
} // namespace

ax::isize ax::count_true(span<bool const> values) { return count_equal(values, true); }
ax::isize ax::count_false(span<bool const> values) { return count_equal(values, false); }

bool ax::all_true(span<bool const> values) { return count_equal(values, false) == 0; }
bool ax::all_false(span<bool const> values) { return count_equal(values, true) == 0; }
bool ax::any_true(span<bool const> values) { return first_index_of(values, true) >= 0; }
bool ax::any_false(span<bool const> values) { return first_index_of(values, false) >= 0; }

std::vector<bool> ax::invert(span<bool const> values)
{
    std::vector<bool> result;
    result.reserve(values.size());
    for (auto v : values)
        result.push_back(!v);
    return result;
}

std::vector<bool> ax::and_each(span<bool const> a, span<bool const> b)
{
    return combine(a, b, "and_each", [](bool x, bool y) { return x && y; });
}

std::vector<bool> ax::or_each(span<bool const> a, span<bool const> b)
{
    return combine(a, b, "or_each", [](bool x, bool y) { return x || y; });
}

std::vector<bool> ax::xor_each(span<bool const> a, span<bool const> b)
{
    return combine(a, b, "xor_each", [](bool x, bool y) { return x != y; });
}

std::vector<ax::isize> ax::true_indices(span<bool const> values) { return indices_of(values, true); }
std::vector<ax::isize> ax::false_indices(span<bool const> values) { return indices_of(values, false); }

ax::f64 ax::true_percentage(span<bool const> values) { return percentage_of(values, true); }
ax::f64 ax::false_percentage(span<bool const> values) { return percentage_of(values, false); }

ax::isize ax::first_true(span<bool const> values) { return first_index_of(values, true); }
ax::isize ax::last_true(span<bool const> values) { return last_index_of(values, true); }
ax::isize ax::first_false(span<bool const> values) { return first_index_of(values, false); }
ax::isize ax::last_false(span<bool const> values) { return last_index_of(values, false); }

std::string ax::to_binary_string(span<bool const> values)
{
    std::string result;
    result.reserve(values.size());
    for (auto v : values)
        result += v ? '1' : '0';
    return result;
}

std::vector<ax::i32> ax::to_int_array(span<bool const> values)
{
    std::vector<i32> result;
    result.reserve(values.size());
    for (auto v : values)
        result.push_back(v ? 1 : 0);
    return result;
}

std::vector<ax::bool_run> ax::true_runs(span<bool const> values) { return runs_of(values, true); }
std::vector<ax::bool_run> ax::false_runs(span<bool const> values) { return runs_of(values, false); }

ax::bool_run ax::longest_true_run(span<bool const> values) { return longest_run_of(values, true); }
ax::bool_run ax::longest_false_run(span<bool const> values) { return longest_run_of(values, false); }
