#include "date.hh"

#include <arrayx/error.hh>
#include <arrayx/set_ops.hh>

#include <algorithm>

namespace chrono = std::chrono;

namespace
{
chrono::sys_days day_of(ax::date_time d) { return chrono::floor<chrono::days>(d); }

bool is_weekend(ax::date_time d)
{
    auto const wd = ax::weekday_of(d);
    return wd == chrono::Saturday || wd == chrono::Sunday;
}

template <class Pred>
std::vector<ax::date_time> keep_if(ax::span<ax::date_time const> values, Pred pred)
{
    std::vector<ax::date_time> result;
    for (auto d : values)
        if (pred(d))
            result.push_back(d);
    return result;
}

template <class KeyFn>
auto group_by_key(ax::span<ax::date_time const> values, KeyFn key)
{
    using key_t = decltype(key(std::declval<ax::date_time>()));

    ax::date_groups<key_t> groups;
    for (auto d : values)
    {
        auto const k = key(d);
        auto it = std::find_if(groups.begin(), groups.end(), [&](auto const& g) { return g.first == k; });
        if (it == groups.end())
            groups.emplace_back(k, std::vector<ax::date_time>{d});
        else
            it->second.push_back(d);
    }
    return groups;
}

chrono::seconds abs_distance(ax::date_time a, ax::date_time b) { return a < b ? b - a : a - b; }
} // namespace

// =========================================================================================================
// Calendar helpers
// =========================================================================================================

char const* ax::to_string(season s)
{
    switch (s)
    {
    case season::winter:
        return "winter";
    case season::spring:
        return "spring";
    case season::summer:
        return "summer";
    case season::autumn:
        return "autumn";
    }
    return "<unknown season>";
}

ax::date_time ax::make_date(int year, unsigned month, unsigned day, int hour, int minute, int second)
{
    auto const ymd = chrono::year(year) / chrono::month(month) / chrono::day(day);
    if (!ymd.ok())
        impl::raise_error(error_kind::invalid_argument,
                          "make_date: " + std::to_string(year) + "-" + std::to_string(month) + "-" + std::to_string(day) + " is not a valid date",
                          ax::source_location::current());

    impl::check_value(hour, 0, 23, "make_date", "hour");
    impl::check_value(minute, 0, 59, "make_date", "minute");
    impl::check_value(second, 0, 59, "make_date", "second");

    return chrono::sys_days(ymd) + chrono::hours(hour) + chrono::minutes(minute) + chrono::seconds(second);
}

chrono::year_month_day ax::calendar_date(date_time d) { return chrono::year_month_day(day_of(d)); }

chrono::weekday ax::weekday_of(date_time d) { return chrono::weekday(day_of(d)); }

int ax::quarter_of(date_time d)
{
    auto const month = unsigned(calendar_date(d).month());
    return int((month - 1) / 3 + 1);
}

ax::season ax::season_of(date_time d)
{
    switch (unsigned(calendar_date(d).month()))
    {
    case 12:
    case 1:
    case 2:
        return season::winter;
    case 3:
    case 4:
    case 5:
        return season::spring;
    case 6:
    case 7:
    case 8:
        return season::summer;
    default:
        return season::autumn;
    }
}

int ax::decade_of(date_time d)
{
    auto const year = int(calendar_date(d).year());
    // floor towards negative infinity for years before 0
    auto const r = ((year % 10) + 10) % 10;
    return year - r;
}

// =========================================================================================================
// Extremes
// =========================================================================================================

ax::date_time ax::earliest(span<date_time const> values)
{
    impl::check_not_empty(values.size(), "earliest");
    return *std::min_element(values.begin(), values.end());
}

ax::date_time ax::latest(span<date_time const> values)
{
    impl::check_not_empty(values.size(), "latest");
    return *std::max_element(values.begin(), values.end());
}

chrono::seconds ax::span_of(span<date_time const> values)
{
    impl::check_not_empty(values.size(), "span_of");
    auto const [lo, hi] = std::minmax_element(values.begin(), values.end());
    return *hi - *lo;
}

ax::date_time ax::closest_to(span<date_time const> values, date_time reference)
{
    impl::check_not_empty(values.size(), "closest_to");

    auto best = values[0];
    for (auto d : values)
        if (abs_distance(d, reference) < abs_distance(best, reference))
            best = d;
    return best;
}

std::vector<ax::date_time> ax::equidistant_dates(span<date_time const> values, date_time reference)
{
    if (values.empty())
        return {};

    auto const best = abs_distance(closest_to(values, reference), reference);
    return keep_if(values, [&](date_time d) { return abs_distance(d, reference) == best; });
}

// =========================================================================================================
// Filters
// =========================================================================================================

std::vector<ax::date_time> ax::filter_range(span<date_time const> values, date_time start, date_time end)
{
    return keep_if(values, [&](date_time d) { return start <= d && d <= end; });
}

std::vector<ax::date_time> ax::filter_weekdays(span<date_time const> values)
{
    return keep_if(values, [](date_time d) { return !is_weekend(d); });
}

std::vector<ax::date_time> ax::filter_weekends(span<date_time const> values)
{
    return keep_if(values, is_weekend);
}

std::vector<ax::date_time> ax::filter_holidays(span<date_time const> values, span<date_time const> holidays)
{
    return intersect(values, holidays);
}

std::vector<ax::date_time> ax::filter_nth_weekday(span<date_time const> values, chrono::weekday wd, int n)
{
    impl::check_value(n, 1, 5, "filter_nth_weekday", "n");

    return keep_if(values,
                   [&](date_time d)
                   {
                       auto const day = unsigned(calendar_date(d).day());
                       return weekday_of(d) == wd && int((day - 1) / 7) == n - 1;
                   });
}

std::vector<ax::date_time> ax::filter_last_weekday(span<date_time const> values, chrono::weekday wd)
{
    return keep_if(values,
                   [&](date_time d)
                   {
                       auto const next_week = calendar_date(d + chrono::days(7));
                       return weekday_of(d) == wd && next_week.month() != calendar_date(d).month();
                   });
}

// =========================================================================================================
// Predicates
// =========================================================================================================

bool ax::all_in_future(span<date_time const> values, date_time now)
{
    return std::all_of(values.begin(), values.end(), [&](date_time d) { return d > now; });
}

bool ax::all_in_future(span<date_time const> values)
{
    return all_in_future(values, chrono::floor<chrono::seconds>(chrono::system_clock::now()));
}

bool ax::all_in_past(span<date_time const> values, date_time now)
{
    return std::all_of(values.begin(), values.end(), [&](date_time d) { return d < now; });
}

bool ax::all_in_past(span<date_time const> values)
{
    return all_in_past(values, chrono::floor<chrono::seconds>(chrono::system_clock::now()));
}

// =========================================================================================================
// Grouping
// =========================================================================================================

ax::date_groups<int> ax::group_by_year(span<date_time const> values)
{
    return group_by_key(values, [](date_time d) { return int(calendar_date(d).year()); });
}

ax::date_groups<unsigned> ax::group_by_month(span<date_time const> values)
{
    return group_by_key(values, [](date_time d) { return unsigned(calendar_date(d).month()); });
}

ax::date_groups<unsigned> ax::group_by_day(span<date_time const> values)
{
    return group_by_key(values, [](date_time d) { return unsigned(calendar_date(d).day()); });
}

ax::date_groups<chrono::weekday> ax::group_by_weekday(span<date_time const> values)
{
    return group_by_key(values, weekday_of);
}

ax::date_groups<int> ax::group_by_quarter(span<date_time const> values)
{
    return group_by_key(values, quarter_of);
}

ax::date_groups<ax::season> ax::group_by_season(span<date_time const> values)
{
    return group_by_key(values, season_of);
}

ax::date_groups<int> ax::group_by_decade(span<date_time const> values)
{
    return group_by_key(values, decade_of);
}

// =========================================================================================================
// Business days
// =========================================================================================================

ax::isize ax::business_days_count(span<date_time const> values)
{
    impl::check_not_empty(values.size(), "business_days_count");

    auto const [lo, hi] = std::minmax_element(values.begin(), values.end());
    auto const start = *lo;
    auto const whole_days = chrono::floor<chrono::days>(*hi - *lo).count();

    isize count = 0;
    for (isize i = 0; i <= whole_days; ++i)
        if (!is_weekend(start + chrono::days(i)))
            ++count;
    return count;
}
