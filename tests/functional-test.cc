#include <arrayx/functional.hh>

#include <nexus/test.hh>

#include <string>
#include <utility>
#include <vector>

#include "test-helpers.hh"

namespace
{
using ints = std::vector<int>;
}

TEST("functional - mapping")
{
    auto const words = std::vector<std::string>{"a", "bcd", "ef"};

    auto const lengths = ax::map(words, [](std::string const& w) { return ax::isize(w.size()); });
    CHECK(lengths == std::vector<ax::isize>({1, 3, 2}));
    CHECK(ax::map(ints{}, [](int v) { return v * 2; }).empty());

    auto const tagged = ax::map_indexed(words, [](std::string const& w, ax::isize i) { return std::to_string(i) + w; });
    CHECK(tagged == std::vector<std::string>({"0a", "1bcd", "2ef"}));

    CHECK(ax::zip_with(ints{1, 2, 3}, ints{10, 20}, [](int a, int b) { return a + b; }) == ints({11, 22}));
    CHECK(ax::zip_with(ints{}, ints{1}, [](int a, int b) { return a * b; }).empty());

    SECTION("zip_exact")
    {
        auto const pairs = ax::zip_exact(ints{1, 2}, std::string("xy"));
        REQUIRE(pairs.size() == 2);
        CHECK(pairs[0] == std::pair(1, 'x'));
        CHECK(pairs[1] == std::pair(2, 'y'));

        CHECK(test::error_kind_of([] { return ax::zip_exact(ints{1, 2}, ints{1}); }) == ax::error_kind::length_mismatch);
        CHECK(ax::zip_exact(ints{}, ints{}).empty());
    }

    SECTION("for_each_indexed")
    {
        std::string visited;
        ax::for_each_indexed(words, [&](std::string const& w, ax::isize i) { visited += w + std::to_string(i) + ";"; });
        CHECK(visited == "a0;bcd1;ef2;");
    }
}

TEST("functional - reductions")
{
    auto const minus = [](int a, int b) { return a - b; };

    CHECK(ax::fold_left(ints{1, 2, 3}, minus) == -4);
    CHECK(ax::fold_left(ints{9}, minus) == 9);
    CHECK(ax::fold_right(ints{1, 2, 3}, minus) == 0);
    CHECK(ax::fold_right(ints{9}, minus) == 9);
    CHECK(test::error_kind_of([&] { return ax::fold_left(ints{}, minus); }) == ax::error_kind::invalid_argument);
    CHECK(test::error_kind_of([&] { return ax::fold_right(ints{}, minus); }) == ax::error_kind::invalid_argument);

    auto const concat = [](std::string acc, std::string const& s) { return acc + s; };
    CHECK(ax::fold_left(std::vector<std::string>{"a", "b", "c"}, concat) == "abc");
    CHECK(ax::fold_right(std::vector<std::string>{"a", "b", "c"}, concat) == "cba");

    auto const words = std::vector<std::string>{"one", "three", "xy"};
    auto const length = [](std::string const& s) { return ax::isize(s.size()); };
    CHECK(ax::sum_by(words, length) == 10);
    CHECK(ax::sum_by(std::vector<std::string>{}, length) == 0);
    CHECK(ax::average_by(ints{1, 2, 3, 4}, [](int v) { return v; }) == 2.5);
    CHECK(test::error_kind_of([&] { return ax::average_by(std::vector<std::string>{}, length); }) == ax::error_kind::invalid_argument);

    CHECK(ax::join_to_string(ints{1, 2, 3}, ", ") == "1, 2, 3");
    CHECK(ax::join_to_string(ints{7}, ", ") == "7");
    CHECK(ax::join_to_string(ints{}, ", ") == "");
    CHECK(ax::join_to_string(std::vector<std::string>{"a", "b"}, "") == "ab");
}

TEST("functional - splitting")
{
    SECTION("partition")
    {
        auto const [even, odd] = ax::partition(ints{1, 2, 3, 4, 5}, [](int v) { return v % 2 == 0; });
        CHECK(even == ints({2, 4}));
        CHECK(odd == ints({1, 3, 5}));
    }

    SECTION("segment")
    {
        auto const is_zero = [](int v) { return v == 0; };
        CHECK(ax::segment(ints{1, 2, 0, 3, 0, 4}, is_zero) == std::vector<ints>({{1, 2}, {0, 3}, {0, 4}}));
        CHECK(ax::segment(ints{0, 1, 0}, is_zero) == std::vector<ints>({{0, 1}, {0}}));
        CHECK(ax::segment(ints{1, 2}, is_zero) == std::vector<ints>({{1, 2}}));
        CHECK(ax::segment(ints{}, is_zero).empty());
    }

    SECTION("group_by_sequential")
    {
        auto const groups = ax::group_by_sequential(ints{1, 3, 2, 4, 5}, [](int v) { return v % 2; });
        REQUIRE(groups.size() == 3);
        CHECK(groups[0].first == 1);
        CHECK(groups[0].second == ints({1, 3}));
        CHECK(groups[1].first == 0);
        CHECK(groups[1].second == ints({2, 4}));
        CHECK(groups[2].first == 1);
        CHECK(groups[2].second == ints({5}));

        CHECK(ax::group_by_sequential(ints{}, [](int v) { return v; }).empty());
    }

    SECTION("take_while and skip_while")
    {
        auto const small = [](int v) { return v < 3; };
        CHECK(ax::take_while(ints{1, 2, 3, 1}, small) == ints({1, 2}));
        CHECK(ax::skip_while(ints{1, 2, 3, 1}, small) == ints({3, 1}));
        CHECK(ax::take_while(ints{5, 1}, small).empty());
        CHECK(ax::skip_while(ints{1, 2}, small).empty());
    }

    SECTION("sequential_pairs")
    {
        auto const pairs = ax::sequential_pairs(ints{1, 2, 3});
        REQUIRE(pairs.size() == 2);
        CHECK(pairs[0] == std::pair(1, 2));
        CHECK(pairs[1] == std::pair(2, 3));
        CHECK(ax::sequential_pairs(ints{1}).empty());
        CHECK(ax::sequential_pairs(ints{}).empty());
    }
}
