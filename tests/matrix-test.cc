#include <arrayx/matrix.hh>

#include <nexus/test.hh>

#include <string>
#include <utility>
#include <vector>

#include "test-helpers.hh"

namespace
{
using ints = std::vector<int>;
using grid = ax::matrix<int>;

// 1 2 3
// 4 5 6
grid two_by_three() { return grid::from_rows({{1, 2, 3}, {4, 5, 6}}); }
} // namespace

TEST("matrix - construction")
{
    auto const m = two_by_three();
    CHECK(m.rows() == 2);
    CHECK(m.cols() == 3);
    CHECK(m.size() == 6);
    CHECK(!m.empty());
    CHECK(m(0, 0) == 1);
    CHECK(m(1, 2) == 6);

    auto const filled = grid(2, 2, 7);
    CHECK(filled.size() == 4);
    CHECK(filled(1, 1) == 7);

    CHECK(grid().empty());
    CHECK(grid::from_rows({}).empty());

    auto const words = ax::matrix<std::string>::from_rows({{"a", "b"}, {"c", "d"}});
    CHECK(words(1, 0) == "c");

    CHECK(test::error_kind_of([] { return grid::from_rows({{1, 2}, {3}}); }) == ax::error_kind::length_mismatch);
    CHECK(test::error_kind_of([] { return grid::from_rows({{1}, {2}, {3, 4}}); }) == ax::error_kind::length_mismatch);

    SECTION("cells are row-major and writable")
    {
        auto m2 = two_by_three();
        m2(0, 1) = 20;
        CHECK(ax::flatten_matrix(m2) == ints({1, 20, 3, 4, 5, 6}));

        auto const row = m2.row_span(1);
        CHECK(ints(row.begin(), row.end()) == ints({4, 5, 6}));
    }
}

TEST("matrix - transpose and flatten")
{
    auto const m = two_by_three();
    auto const t = ax::transpose(m);

    CHECK(t.rows() == 3);
    CHECK(t.cols() == 2);
    CHECK(ax::flatten_matrix(t) == ints({1, 4, 2, 5, 3, 6}));
    CHECK(t(2, 1) == 6);
    CHECK(ax::transpose(t) == m);

    CHECK(ax::flatten_matrix(m) == ints({1, 2, 3, 4, 5, 6}));
    CHECK(ax::flatten_matrix(grid()).empty());
    CHECK(ax::transpose(grid()).empty());
}

TEST("matrix - cell queries")
{
    auto const m = grid::from_rows({{1, 2, 2}, {2, 5, 6}});

    CHECK(ax::all_equal_cells(grid(3, 2, 4)));
    CHECK(!ax::all_equal_cells(m));
    CHECK(ax::all_equal_cells(grid(1, 1, 0)));
    CHECK(test::error_kind_of([] { return ax::all_equal_cells(grid()); }) == ax::error_kind::invalid_argument);

    CHECK(ax::count_cells(m, 2) == 3);
    CHECK(ax::count_cells(m, 9) == 0);
    CHECK(ax::contains_cell(m, 5));
    CHECK(!ax::contains_cell(m, 9));
    CHECK(!ax::contains_cell(grid(), 0));

    SECTION("find_first_cell scans row by row")
    {
        auto const big = ax::find_first_cell(m, [](int v) { return v > 4; });
        REQUIRE(big.has_value());
        CHECK(big->first == 1);
        CHECK(big->second == 1);

        auto const two = ax::find_first_cell(m, [](int v) { return v == 2; });
        REQUIRE(two.has_value());
        CHECK(*two == (std::pair<ax::isize, ax::isize>(0, 1)));

        CHECK(!ax::find_first_cell(m, [](int v) { return v < 0; }).has_value());
    }

    SECTION("for_each_cell")
    {
        auto sum = 0;
        ax::for_each_cell(m, [&](int v) { sum += v; });
        CHECK(sum == 18);
    }

    SECTION("fill_matrix")
    {
        auto m2 = two_by_three();
        ax::fill_matrix(m2, 0);
        CHECK(ax::count_cells(m2, 0) == 6);
        CHECK(m2.rows() == 2);
    }
}

TEST("matrix - rows and columns")
{
    auto const m = two_by_three();

    CHECK(ax::get_row(m, 0) == ints({1, 2, 3}));
    CHECK(ax::get_row(m, 1) == ints({4, 5, 6}));
    CHECK(ax::get_column(m, 0) == ints({1, 4}));
    CHECK(ax::get_column(m, 2) == ints({3, 6}));

    CHECK(test::error_kind_of([&] { return ax::get_row(m, 2); }) == ax::error_kind::index_out_of_range);
    CHECK(test::error_kind_of([&] { return ax::get_row(m, -1); }) == ax::error_kind::index_out_of_range);
    CHECK(test::error_kind_of([&] { return ax::get_column(m, 3); }) == ax::error_kind::index_out_of_range);
    CHECK(test::error_kind_of([&] { return ax::get_column(m, -1); }) == ax::error_kind::index_out_of_range);
}

TEST("matrix - rotation")
{
    auto const m = two_by_three();

    SECTION("clockwise")
    {
        // 4 1
        // 5 2
        // 6 3
        auto const r = ax::rotate_clockwise(m);
        CHECK(r.rows() == 3);
        CHECK(r.cols() == 2);
        CHECK(ax::flatten_matrix(r) == ints({4, 1, 5, 2, 6, 3}));
    }

    SECTION("counterclockwise")
    {
        // 3 6
        // 2 5
        // 1 4
        auto const r = ax::rotate_counterclockwise(m);
        CHECK(r.rows() == 3);
        CHECK(r.cols() == 2);
        CHECK(ax::flatten_matrix(r) == ints({3, 6, 2, 5, 1, 4}));
    }

    SECTION("inverse rotations")
    {
        CHECK(ax::rotate_counterclockwise(ax::rotate_clockwise(m)) == m);
        CHECK(ax::rotate_clockwise(ax::rotate_clockwise(ax::rotate_clockwise(ax::rotate_clockwise(m)))) == m);
        CHECK(ax::rotate_clockwise(ax::rotate_clockwise(m)) == grid::from_rows({{6, 5, 4}, {3, 2, 1}}));
    }

    CHECK(ax::rotate_clockwise(grid()).empty());
}

TEST("matrix - bool cells")
{
    using bools = std::vector<bool>;
    using mask = ax::matrix<bool>;

    // 1 0 0
    // 1 1 0
    auto m = mask::from_rows({{true, false, false}, {true, true, false}});
    CHECK(m.rows() == 2);
    CHECK(m.cols() == 3);
    CHECK(m(1, 1));
    CHECK(!m(0, 2));
    CHECK(ax::count_cells(m, true) == 3);

    m(0, 2) = true;
    CHECK(ax::flatten_matrix(m) == bools({true, false, true, true, true, false}));
    CHECK(ax::get_row(m, 1) == bools({true, true, false}));
    CHECK(ax::get_column(m, 2) == bools({true, false}));

    auto const row = m.row_span(0);
    CHECK(row.size() == 3);
    CHECK(row[2]);

    auto const t = ax::transpose(m);
    CHECK(t.rows() == 3);
    CHECK(ax::flatten_matrix(t) == bools({true, true, false, true, true, false}));
    CHECK(ax::rotate_counterclockwise(ax::rotate_clockwise(m)) == m);

    auto copy = m;
    ax::fill_matrix(copy, false);
    CHECK(ax::all_equal_cells(copy));
    CHECK(!ax::contains_cell(copy, true));
    CHECK(ax::contains_cell(m, true));
    CHECK(!(copy == m));

    CHECK(ax::all_equal_cells(mask(2, 2, true)));
}
