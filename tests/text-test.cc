#include <arrayx/text.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

#include "test-helpers.hh"

namespace
{
using strings = std::vector<std::string>;
}

TEST("text - checks")
{
    CHECK(ax::any_empty(strings{"a", ""}));
    CHECK(!ax::any_empty(strings{"a", " "}));
    CHECK(!ax::any_empty(strings{}));

    CHECK(ax::any_blank(strings{"a", " \t"}));
    CHECK(ax::any_blank(strings{""}));
    CHECK(!ax::any_blank(strings{"a", " b "}));

    CHECK(ax::has_duplicates(strings{"x", "y", "x"}));
    CHECK(!ax::has_duplicates(strings{"x", "X"}));

    CHECK(ax::all_of_length(strings{"ab", "cd"}, 2));
    CHECK(!ax::all_of_length(strings{"ab", "c"}, 2));
    CHECK(ax::all_of_length(strings{}, 7));

    auto const words = strings{"apple", "banana", "cherry"};
    CHECK(ax::any_contains(words, "nan"));
    CHECK(!ax::any_contains(words, "kiwi"));
    CHECK(ax::any_starts_with(words, "ch"));
    CHECK(!ax::any_starts_with(words, "an"));
    CHECK(ax::any_ends_with(words, "le"));
    CHECK(!ax::any_ends_with(words, "an"));
}

TEST("text - filtering")
{
    CHECK(ax::remove_empty(strings{"a", "", " ", ""}) == strings({"a", " "}));
    CHECK(ax::remove_blank(strings{"a", "", " \n", "b"}) == strings({"a", "b"}));
    CHECK(ax::unique(strings{"b", "a", "b", "a"}) == strings({"b", "a"}));

    SECTION("patterns")
    {
        auto const words = strings{"apple", "banana", "cherry"};
        CHECK(ax::filter_by_pattern(words, "an") == strings({"banana"}));
        CHECK(ax::filter_by_pattern(words, "^[ac]") == strings({"apple", "cherry"}));
        CHECK(ax::filter_by_pattern(words, "r{2}y$") == strings({"cherry"}));
        CHECK(ax::filter_by_pattern(words, "z").empty());
        CHECK(ax::count_matching(words, "a") == 2);
        CHECK(ax::count_matching(words, "") == 3);
    }

    SECTION("malformed patterns")
    {
        auto const words = strings{"a"};
        CHECK(test::error_kind_of([&] { return ax::filter_by_pattern(words, "(["); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([&] { return ax::count_matching(words, "(a"); }) == ax::error_kind::invalid_argument);
    }
}

TEST("text - transforms")
{
    CHECK(ax::trim_all(strings{"  a ", "\tb\n", "", "   "}) == strings({"a", "b", "", ""}));
    CHECK(ax::to_upper_all(strings{"abc", "x1y"}) == strings({"ABC", "X1Y"}));
    CHECK(ax::to_lower_all(strings{"ABC", "X1y"}) == strings({"abc", "x1y"}));
    CHECK(ax::reverse_each(strings{"abc", ""}) == strings({"cba", ""}));

    CHECK(ax::normalize_whitespace(strings{"a  b\t\tc", " x ", "\n\n"}) == strings({"a b c", " x ", " "}));
    CHECK(ax::capitalize_first_letter(strings{"hELLO", "", "1abC"}) == strings({"Hello", "", "1abc"}));

    SECTION("replace_in_all")
    {
        CHECK(ax::replace_in_all(strings{"aaa", "abc"}, "aa", "b") == strings({"ba", "abc"}));
        CHECK(ax::replace_in_all(strings{"a-b-c"}, "-", "") == strings({"abc"}));
        CHECK(ax::replace_in_all(strings{"ab"}, "b", "bb") == strings({"abb"}));
        CHECK(test::error_kind_of([] { return ax::replace_in_all(strings{"a"}, "", "x"); }) == ax::error_kind::invalid_argument);
    }

    CHECK(ax::sort_alphabetically(strings{"b", "B", "a", "ab"}) == strings({"B", "a", "ab", "b"}));
}

TEST("text - reductions")
{
    CHECK(ax::join(strings{"a", "b", "c"}, ",") == "a,b,c");
    CHECK(ax::join(strings{"a"}, ",") == "a");
    CHECK(ax::join(strings{}, ",") == "");
    CHECK(ax::join(strings{"a", "", "b"}, "-") == "a--b");
    CHECK(ax::join_non_empty(strings{"a", "", "b"}, "-") == "a-b");

    CHECK(ax::count_substring(strings{"aaaa", "a", "banana"}, "aa") == 2);
    CHECK(ax::count_substring(strings{"banana"}, "an") == 2);
    CHECK(test::error_kind_of([] { return ax::count_substring(strings{"a"}, ""); }) == ax::error_kind::invalid_argument);

    CHECK(ax::longest(strings{"ab", "cde", "fgh"}) == "cde");
    CHECK(ax::shortest(strings{"ab", "c", "d"}) == "c");
    CHECK(!ax::longest(strings{}).has_value());
    CHECK(!ax::shortest(strings{}).has_value());

    SECTION("aggregate")
    {
        auto const slash = [](std::string const& acc, std::string const& w) { return acc + "/" + w; };
        CHECK(ax::aggregate(strings{"usr", "local", "bin"}, slash) == "usr/local/bin");
        CHECK(ax::aggregate(strings{"root"}, slash) == "root");
        CHECK(test::error_kind_of([&] { return ax::aggregate(strings{}, slash); }) == ax::error_kind::invalid_argument);
    }
}
