#pragma once

#include <arrayx/assert.hh>
#include <arrayx/error.hh>
#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <algorithm>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// =========================================================================================================
// Two-dimensional arrays
// =========================================================================================================
//
// ax::matrix<T> is a rectangular grid stored row-major in one contiguous heap block.
// A matrix may be empty (0 x 0, or n x 0 / 0 x n after a transpose).
//
//   auto m = ax::matrix<int>::from_rows({{1, 2, 3},
//                                        {4, 5, 6}});   // 2 x 3
//   m(1, 2) == 6
//
// Cell access through operator() is assertion-checked, get_row / get_column throw index_out_of_range.
//
// Operations:
//   for_each_cell(m, fn)             - fn(value) in row-major order
//   transpose(m)                     - cols x rows
//   flatten_matrix(m)                - row-major cell values
//   all_equal_cells(m)               - every cell equals m(0, 0), empty -> invalid_argument
//   count_cells(m, v)                - number of cells equal to v
//   fill_matrix(m, v)                - in place
//   find_first_cell(m, pred)         - {row, col} of the first match in row-major order
//   get_row(m, r) / get_column(m, c)
//   rotate_clockwise / rotate_counterclockwise(m)
//   contains_cell(m, v)
//

template <class T>
struct ax::matrix
{
    // construction
public:
    matrix() = default;
    matrix(isize rows, isize cols, T const& value = T()) : _rows(rows), _cols(cols), _cells(allocate_cells(rows, cols))
    {
        std::fill_n(_cells.get(), size(), value);
    }

    /// Throws length_mismatch if the rows are not all of the same length
    [[nodiscard]] static matrix from_rows(std::vector<std::vector<T>> const& rows)
    {
        auto const cols = rows.empty() ? isize(0) : isize(rows.front().size());
        for (auto const& row : rows)
            impl::check_same_length(isize(row.size()), cols, "matrix::from_rows");

        matrix m(isize(rows.size()), cols);
        auto out = m._cells.get();
        for (auto const& row : rows)
            out = std::copy(row.begin(), row.end(), out);
        return m;
    }

    matrix(matrix const& rhs) : _rows(rhs._rows), _cols(rhs._cols), _cells(allocate_cells(rhs._rows, rhs._cols))
    {
        std::copy_n(rhs._cells.get(), size(), _cells.get());
    }
    matrix(matrix&& rhs) noexcept
      : _rows(std::exchange(rhs._rows, 0)), _cols(std::exchange(rhs._cols, 0)), _cells(std::move(rhs._cells))
    {
    }
    matrix& operator=(matrix const& rhs)
    {
        if (this != &rhs)
            *this = matrix(rhs);
        return *this;
    }
    matrix& operator=(matrix&& rhs) noexcept
    {
        _rows = std::exchange(rhs._rows, 0);
        _cols = std::exchange(rhs._cols, 0);
        _cells = std::move(rhs._cells);
        return *this;
    }
    ~matrix() = default;

    // queries
public:
    [[nodiscard]] isize rows() const { return _rows; }
    [[nodiscard]] isize cols() const { return _cols; }
    [[nodiscard]] isize size() const { return _rows * _cols; }
    [[nodiscard]] bool empty() const { return size() == 0; }

    // access
public:
    [[nodiscard]] T& operator()(isize r, isize c)
    {
        AX_ASSERT(0 <= r && r < _rows && 0 <= c && c < _cols, "cell out of bounds");
        return _cells[r * _cols + c];
    }
    [[nodiscard]] T const& operator()(isize r, isize c) const
    {
        AX_ASSERT(0 <= r && r < _rows && 0 <= c && c < _cols, "cell out of bounds");
        return _cells[r * _cols + c];
    }

    [[nodiscard]] span<T const> row_span(isize r) const
    {
        AX_ASSERT(0 <= r && r < _rows, "row out of bounds");
        return span<T const>(_cells.get() + r * _cols, _cols);
    }

    /// all cells, row-major
    [[nodiscard]] span<T const> cells() const { return span<T const>(_cells.get(), size()); }
    [[nodiscard]] span<T> cells() { return span<T>(_cells.get(), size()); }

    bool operator==(matrix const& rhs) const
    {
        if (_rows != rhs._rows || _cols != rhs._cols)
            return false;
        return std::equal(_cells.get(), _cells.get() + size(), rhs._cells.get());
    }

private:
    // sizes are checked before anything is allocated
    static std::unique_ptr<T[]> allocate_cells(isize rows, isize cols)
    {
        AX_ASSERT(rows >= 0 && cols >= 0, "negative matrix size");
        if (rows <= 0 || cols <= 0)
            return nullptr;
        return std::make_unique<T[]>(rows * cols);
    }

    isize _rows = 0;
    isize _cols = 0;
    std::unique_ptr<T[]> _cells;
};

namespace ax
{
template <class T, class F>
void for_each_cell(matrix<T> const& m, F&& fn)
{
    for (auto const& v : m.cells())
        fn(v);
}

template <class T>
[[nodiscard]] matrix<T> transpose(matrix<T> const& m)
{
    matrix<T> result(m.cols(), m.rows());
    for (isize r = 0; r < m.rows(); ++r)
        for (isize c = 0; c < m.cols(); ++c)
            result(c, r) = m(r, c);
    return result;
}

template <class T>
[[nodiscard]] std::vector<T> flatten_matrix(matrix<T> const& m)
{
    auto const cells = m.cells();
    return std::vector<T>(cells.begin(), cells.end());
}

template <class T>
[[nodiscard]] bool all_equal_cells(matrix<T> const& m)
{
    impl::check_not_empty(m.size(), "all_equal_cells");

    auto const& first = m(0, 0);
    for (auto const& v : m.cells())
        if (!(v == first))
            return false;
    return true;
}

template <class T>
[[nodiscard]] isize count_cells(matrix<T> const& m, T const& value)
{
    isize count = 0;
    for (auto const& v : m.cells())
        if (v == value)
            ++count;
    return count;
}

template <class T>
[[nodiscard]] bool contains_cell(matrix<T> const& m, T const& value)
{
    for (auto const& v : m.cells())
        if (v == value)
            return true;
    return false;
}

template <class T>
void fill_matrix(matrix<T>& m, T const& value)
{
    for (auto& v : m.cells())
        v = value;
}

template <class T, class Pred>
[[nodiscard]] std::optional<std::pair<isize, isize>> find_first_cell(matrix<T> const& m, Pred&& pred)
{
    for (isize r = 0; r < m.rows(); ++r)
        for (isize c = 0; c < m.cols(); ++c)
            if (pred(m(r, c)))
                return std::pair{r, c};
    return std::nullopt;
}

template <class T>
[[nodiscard]] std::vector<T> get_row(matrix<T> const& m, isize row)
{
    impl::check_index(row, 0, m.rows(), "get_row", "row");
    auto const s = m.row_span(row);
    return std::vector<T>(s.begin(), s.end());
}

template <class T>
[[nodiscard]] std::vector<T> get_column(matrix<T> const& m, isize col)
{
    impl::check_index(col, 0, m.cols(), "get_column", "column");
    std::vector<T> result;
    result.reserve(m.rows());
    for (isize r = 0; r < m.rows(); ++r)
        result.push_back(m(r, col));
    return result;
}

/// cell (r, c) moves to (c, rows - 1 - r)
template <class T>
[[nodiscard]] matrix<T> rotate_clockwise(matrix<T> const& m)
{
    matrix<T> result(m.cols(), m.rows());
    for (isize r = 0; r < m.rows(); ++r)
        for (isize c = 0; c < m.cols(); ++c)
            result(c, m.rows() - 1 - r) = m(r, c);
    return result;
}

/// cell (r, c) moves to (cols - 1 - c, r)
template <class T>
[[nodiscard]] matrix<T> rotate_counterclockwise(matrix<T> const& m)
{
    matrix<T> result(m.cols(), m.rows());
    for (isize r = 0; r < m.rows(); ++r)
        for (isize c = 0; c < m.cols(); ++c)
            result(m.cols() - 1 - c, r) = m(r, c);
    return result;
}
} // namespace ax
