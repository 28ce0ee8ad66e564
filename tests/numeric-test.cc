#include <arrayx/numeric.hh>

#include <nexus/test.hh>

#include <limits>
#include <random>
#include <vector>

#include "test-helpers.hh"

namespace
{
using doubles = std::vector<ax::f64>;

bool all_near(doubles const& actual, doubles const& expected)
{
    if (actual.size() != expected.size())
        return false;
    for (size_t i = 0; i < actual.size(); ++i)
        if (!test::is_near(actual[i], expected[i]))
            return false;
    return true;
}
} // namespace

TEST("numeric - summaries")
{
    SECTION("mean, range and median")
    {
        CHECK(ax::mean(doubles{1, 2, 3, 4}) == 2.5);
        CHECK(ax::range(doubles{3, -1, 7}) == 8);
        CHECK(ax::range(doubles{5}) == 0);
        CHECK(ax::median(doubles{3, 1, 2}) == 2);
        CHECK(ax::median(doubles{4, 1, 3, 2}) == 2.5);
        CHECK(ax::median(doubles{-1}) == -1);
    }

    SECTION("percentile interpolates between ranks")
    {
        auto const v = doubles{5, 1, 4, 2, 3};
        CHECK(ax::percentile(v, 0) == 1);
        CHECK(ax::percentile(v, 25) == 2);
        CHECK(ax::percentile(v, 50) == 3);
        CHECK(ax::percentile(v, 100) == 5);
        CHECK(test::is_near(ax::percentile(doubles{1, 2, 3, 4}, 50), 2.5));
        CHECK(test::is_near(ax::percentile(doubles{10, 20}, 30), 13));

        CHECK(test::error_kind_of([&] { return ax::percentile(v, 101); }) == ax::error_kind::value_out_of_range);
        CHECK(test::error_kind_of([&] { return ax::percentile(v, -0.5); }) == ax::error_kind::value_out_of_range);
    }

    SECTION("median agrees with the 50th percentile")
    {
        std::mt19937_64 rng(7);
        std::uniform_real_distribution<ax::f64> value(-100, 100);

        // odd and even lengths alike
        for (auto n = 1; n <= 40; ++n)
        {
            doubles v(n);
            for (auto& x : v)
                x = value(rng);

            CHECK(test::is_near(ax::median(v), ax::percentile(v, 50)));
        }
    }

    SECTION("spread")
    {
        auto const v = doubles{2, 4, 4, 4, 5, 5, 7, 9};
        CHECK(test::is_near(ax::variance(v), 4));
        CHECK(test::is_near(ax::standard_deviation(v), 2));
        CHECK(ax::variance(doubles{3, 3, 3}) == 0);
    }

    SECTION("shape")
    {
        CHECK(test::is_near(ax::skewness(doubles{1, 2, 3}), 0));
        CHECK(ax::skewness(doubles{1, 2, 10}) > 0);
        CHECK(ax::skewness(doubles{-10, -2, -1}) < 0);
        CHECK(ax::skewness(doubles{4, 4}) == 0);

        CHECK(test::is_near(ax::kurtosis(doubles{1, 2, 3, 4, 5}), -1.3));
        CHECK(ax::kurtosis(doubles{4, 4, 4}) == 0);
    }

    SECTION("correlation")
    {
        CHECK(test::is_near(ax::correlation(doubles{1, 2, 3}, doubles{2, 4, 6}), 1));
        CHECK(test::is_near(ax::correlation(doubles{1, 2, 3}, doubles{3, 2, 1}), -1));
        CHECK(ax::correlation(doubles{1, 2, 3}, doubles{7, 7, 7}) == 0);
        CHECK(test::error_kind_of([] { return ax::correlation(doubles{1, 2}, doubles{1}); }) == ax::error_kind::length_mismatch);
        CHECK(test::error_kind_of([] { return ax::correlation(doubles{}, doubles{}); }) == ax::error_kind::invalid_argument);
    }

    SECTION("empty input")
    {
        auto const empty = doubles{};
        CHECK(test::error_kind_of([&] { return ax::mean(empty); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([&] { return ax::range(empty); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([&] { return ax::median(empty); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([&] { return ax::percentile(empty, 50); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([&] { return ax::variance(empty); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([&] { return ax::standard_deviation(empty); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([&] { return ax::skewness(empty); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([&] { return ax::kurtosis(empty); }) == ax::error_kind::invalid_argument);
    }
}

TEST("numeric - transforms")
{
    SECTION("normalize and standardize")
    {
        CHECK(all_near(ax::normalize(doubles{2, 4, 6}), {0, 0.5, 1}));
        CHECK(ax::normalize(doubles{3, 3}) == doubles({0, 0}));
        CHECK(all_near(ax::standardize(doubles{1, 3}), {-1, 1}));
        CHECK(ax::standardize(doubles{2, 2, 2}) == doubles({0, 0, 0}));
        CHECK(test::error_kind_of([] { return ax::normalize(doubles{}); }) == ax::error_kind::invalid_argument);
        CHECK(test::error_kind_of([] { return ax::standardize(doubles{}); }) == ax::error_kind::invalid_argument);
    }

    SECTION("moving_average is centered and clipped")
    {
        auto const v = doubles{1, 2, 3, 4, 5};
        CHECK(all_near(ax::moving_average(v, 3), {1.5, 2, 3, 4, 4.5}));
        CHECK(ax::moving_average(v, 1) == v);
        CHECK(all_near(ax::moving_average(v, 5), {2, 2.5, 3, 3.5, 4}));
        CHECK(test::error_kind_of([&] { return ax::moving_average(v, 0); }) == ax::error_kind::value_out_of_range);
        CHECK(test::error_kind_of([&] { return ax::moving_average(v, 6); }) == ax::error_kind::value_out_of_range);
        CHECK(test::error_kind_of([] { return ax::moving_average(doubles{}, 1); }) == ax::error_kind::invalid_argument);
    }

    SECTION("round_all rounds half to even")
    {
        CHECK(ax::round_all(doubles{0.5, 1.5, 2.5, -0.5, 1.2}, 0) == doubles({0, 2, 2, 0, 1}));
        CHECK(all_near(ax::round_all(doubles{1.234, 1.236}, 2), {1.23, 1.24}));
        CHECK(ax::round_all(doubles{}, 3).empty());

        auto const inf = std::numeric_limits<ax::f64>::infinity();
        CHECK(ax::round_all(doubles{inf}, 2) == doubles({inf}));

        CHECK(test::error_kind_of([] { return ax::round_all(doubles{1}, -1); }) == ax::error_kind::value_out_of_range);
        CHECK(test::error_kind_of([] { return ax::round_all(doubles{1}, 16); }) == ax::error_kind::value_out_of_range);
    }

    SECTION("running values")
    {
        CHECK(ax::cumulative_sum(doubles{1, 2, 3}) == doubles({1, 3, 6}));
        CHECK(ax::cumulative_sum(doubles{}).empty());
        CHECK(ax::diff(doubles{1, 4, 9}) == doubles({3, 5}));
        CHECK(ax::diff(doubles{1}).empty());
    }

    SECTION("non-finite values")
    {
        auto const nan = std::numeric_limits<ax::f64>::quiet_NaN();
        auto const inf = std::numeric_limits<ax::f64>::infinity();
        auto const v = doubles{1, nan, inf, -inf, 2};

        CHECK(ax::remove_non_finite(v) == doubles({1, 2}));
        CHECK(!ax::all_finite(v));
        CHECK(ax::all_finite(doubles{1, 2}));
        CHECK(ax::all_finite(doubles{}));
    }
}

TEST("numeric - queries")
{
    SECTION("local extrema")
    {
        auto const v = doubles{1, 3, 2, 5, 4};
        CHECK(ax::local_maxima(v) == std::vector<ax::isize>({1, 3}));
        CHECK(ax::local_minima(v) == std::vector<ax::isize>({2}));

        // plateaus and end points never count
        CHECK(ax::local_maxima(doubles{1, 2, 2, 1}).empty());
        CHECK(ax::local_minima(doubles{0, 1, 2}).empty());
        CHECK(ax::local_maxima(doubles{}).empty());
    }

    SECTION("find_outliers")
    {
        auto const v = doubles{1, 2, 3, 4, 100};
        CHECK(ax::find_outliers(v) == doubles({100}));
        CHECK(ax::find_outliers(v, 100).empty());
        CHECK(ax::find_outliers(doubles{-50, 1, 2, 3, 4, 100}) == doubles({-50, 100}));
        CHECK(test::error_kind_of([] { return ax::find_outliers(doubles{}); }) == ax::error_kind::invalid_argument);
    }
}
