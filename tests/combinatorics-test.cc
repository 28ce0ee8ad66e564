#include <arrayx/combinatorics.hh>
#include <arrayx/set_ops.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

#include "test-helpers.hh"

namespace
{
using ints = std::vector<int>;
}

TEST("combinatorics - permutations in Heap order")
{
    auto const perms = ax::permutations(ints{1, 2, 3});
    CHECK(perms == std::vector<ints>({{1, 2, 3}, {2, 1, 3}, {3, 1, 2}, {1, 3, 2}, {2, 3, 1}, {3, 2, 1}}));

    CHECK(ax::permutations(ints{7}) == std::vector<ints>({{7}}));
    CHECK(ax::permutations(ints{}).empty());

    SECTION("all orderings are distinct")
    {
        auto const four = ax::permutations(std::string("abcd"));
        CHECK(four.size() == 24);
        CHECK(ax::distinct(four).size() == 24);
    }

    SECTION("duplicate elements are not collapsed")
    {
        CHECK(ax::permutations(ints{1, 1}).size() == 2);
    }
}

TEST("combinatorics - for_each_permutation")
{
    auto const v = ints{1, 2, 3};

    SECTION("void visitor sees everything")
    {
        auto visited = 0;
        auto const outcome = ax::for_each_permutation(v, [&](ax::span<int const> p) {
            CHECK(p.size() == 3);
            ++visited;
        });
        CHECK(outcome == ax::visit_outcome::completed);
        CHECK(visited == 6);
    }

    SECTION("returning true stops")
    {
        std::vector<ints> seen;
        auto const outcome = ax::for_each_permutation(v, [&](ax::span<int const> p) {
            seen.emplace_back(p.begin(), p.end());
            return p[0] == 3;
        });
        CHECK(outcome == ax::visit_outcome::stopped);
        CHECK(seen == std::vector<ints>({{1, 2, 3}, {2, 1, 3}, {3, 1, 2}}));
    }

    SECTION("returning false never stops")
    {
        auto const outcome = ax::for_each_permutation(v, [](ax::span<int const>) { return false; });
        CHECK(outcome == ax::visit_outcome::completed);
    }

    SECTION("empty input")
    {
        auto called = false;
        auto const outcome = ax::for_each_permutation(ints{}, [&](ax::span<int const>) { called = true; });
        CHECK(outcome == ax::visit_outcome::empty);
        CHECK(!called);
    }

    // the input is copied, never permuted in place
    CHECK(v == ints({1, 2, 3}));
}

TEST("combinatorics - subsets in bitmask order")
{
    CHECK(ax::subsets(ints{1, 2}) == std::vector<ints>({{}, {1}, {2}, {1, 2}}));
    CHECK(ax::subsets(ints{1, 2, 3}) == std::vector<ints>({{}, {1}, {2}, {1, 2}, {3}, {1, 3}, {2, 3}, {1, 2, 3}}));
    CHECK(ax::subsets(ints{}) == std::vector<ints>({{}}));
    CHECK(ax::subsets(std::string("abcde")).size() == 32);
}

TEST("combinatorics - for_each_subset")
{
    SECTION("stop at the first subset with two elements")
    {
        ax::isize visited = 0;
        auto const outcome = ax::for_each_subset(ints{1, 2, 3}, [&](ax::span<int const> s) {
            ++visited;
            return s.size() == 2;
        });
        CHECK(outcome == ax::visit_outcome::stopped);
        CHECK(visited == 4);
    }

    SECTION("empty input visits the empty subset")
    {
        ax::isize visited = 0;
        auto const outcome = ax::for_each_subset(ints{}, [&](ax::span<int const> s) {
            CHECK(s.empty());
            ++visited;
        });
        CHECK(outcome == ax::visit_outcome::completed);
        CHECK(visited == 1);
    }

    SECTION("too many elements")
    {
        auto const big = ints(63, 0);
        CHECK(test::error_kind_of([&] { return ax::for_each_subset(big, [](ax::span<int const>) { return true; }); })
              == ax::error_kind::value_out_of_range);
    }
}
