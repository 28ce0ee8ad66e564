#include <arrayx/bools.hh>

#include <nexus/test.hh>

#include <array>
#include <vector>

#include "test-helpers.hh"

namespace
{
using bools = std::vector<bool>;
using indices = std::vector<ax::isize>;

constexpr auto T = true;
constexpr auto F = false;
} // namespace

TEST("bools - counting and checks")
{
    std::array<bool, 5> const v = {T, F, T, T, F};

    CHECK(ax::count_true(v) == 3);
    CHECK(ax::count_false(v) == 2);

    CHECK(!ax::all_true(v));
    CHECK(!ax::all_false(v));
    CHECK(ax::any_true(v));
    CHECK(ax::any_false(v));

    CHECK(ax::all_true({T, T}));
    CHECK(ax::all_false({F, F}));
    CHECK(!ax::any_true({F, F}));
    CHECK(!ax::any_false({T}));

    SECTION("empty input is vacuously all and never any")
    {
        auto const empty = ax::span<bool const>();
        CHECK(ax::all_true(empty));
        CHECK(ax::all_false(empty));
        CHECK(!ax::any_true(empty));
        CHECK(!ax::any_false(empty));
        CHECK(ax::count_true(empty) == 0);
    }
}

TEST("bools - element-wise logic")
{
    CHECK(ax::invert({T, F, F}) == bools({F, T, T}));
    CHECK(ax::invert(ax::span<bool const>()).empty());

    CHECK(ax::and_each({T, T, F, F}, {T, F, T, F}) == bools({T, F, F, F}));
    CHECK(ax::or_each({T, T, F, F}, {T, F, T, F}) == bools({T, T, T, F}));
    CHECK(ax::xor_each({T, T, F, F}, {T, F, T, F}) == bools({F, T, T, F}));

    CHECK(test::error_kind_of([] { return ax::and_each({T}, {T, F}); }) == ax::error_kind::length_mismatch);
    CHECK(test::error_kind_of([] { return ax::or_each({T, F}, {T}); }) == ax::error_kind::length_mismatch);
    CHECK(test::error_kind_of([] { return ax::xor_each({}, {F}); }) == ax::error_kind::length_mismatch);
}

TEST("bools - positions")
{
    std::array<bool, 6> const v = {F, T, T, F, T, F};

    CHECK(ax::true_indices(v) == indices({1, 2, 4}));
    CHECK(ax::false_indices(v) == indices({0, 3, 5}));

    CHECK(ax::first_true(v) == 1);
    CHECK(ax::last_true(v) == 4);
    CHECK(ax::first_false(v) == 0);
    CHECK(ax::last_false(v) == 5);

    CHECK(ax::first_true({F, F}) == -1);
    CHECK(ax::last_true({F, F}) == -1);
    CHECK(ax::first_false({T}) == -1);
    CHECK(ax::last_false(ax::span<bool const>()) == -1);

    CHECK(test::is_near(ax::true_percentage({T, F, F, F}), 25));
    CHECK(test::is_near(ax::false_percentage({T, F, F, F}), 75));
    CHECK(test::is_near(ax::true_percentage({T, F, T}), 200.0 / 3));
    CHECK(ax::true_percentage(ax::span<bool const>()) == 0);
    CHECK(ax::false_percentage(ax::span<bool const>()) == 0);
}

TEST("bools - conversions")
{
    CHECK(ax::to_binary_string({T, F, T, T}) == "1011");
    CHECK(ax::to_binary_string(ax::span<bool const>()) == "");
    CHECK(ax::to_int_array({T, F, T, T}) == std::vector<ax::i32>({1, 0, 1, 1}));
}

TEST("bools - runs")
{
    std::array<bool, 8> const v = {T, T, F, T, F, F, F, T};

    CHECK(ax::true_runs(v) == std::vector<ax::bool_run>({{0, 2}, {3, 1}, {7, 1}}));
    CHECK(ax::false_runs(v) == std::vector<ax::bool_run>({{2, 1}, {4, 3}}));
    CHECK(ax::longest_true_run(v) == (ax::bool_run{0, 2}));
    CHECK(ax::longest_false_run(v) == (ax::bool_run{4, 3}));

    SECTION("first run wins ties")
    {
        CHECK(ax::longest_true_run({T, F, T}) == (ax::bool_run{0, 1}));
        CHECK(ax::longest_false_run({F, F, T, F, F}) == (ax::bool_run{0, 2}));
    }

    SECTION("no run")
    {
        CHECK(ax::true_runs({F, F}).empty());
        CHECK(ax::longest_true_run({F, F}) == (ax::bool_run{}));
        CHECK(ax::longest_false_run(ax::span<bool const>()) == (ax::bool_run{-1, 0}));
    }
}
