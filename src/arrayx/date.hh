#pragma once

#include <arrayx/fwd.hh>
#include <arrayx/span.hh>

#include <chrono>
#include <utility>
#include <vector>

// =========================================================================================================
// Operations on date arrays
// =========================================================================================================
//
// ax::date_time is a UTC time point with second resolution. All calendar fields (year, month, weekday, ...)
// are taken from the proleptic Gregorian calendar in UTC, without time zones or leap seconds.
//
//   auto const d = ax::make_date(2024, 3, 15);           // 2024-03-15 00:00:00
//   auto const t = ax::make_date(2024, 3, 15, 13, 30);   // 2024-03-15 13:30:00
//
// Extremes:
//   earliest / latest / span_of(values)         - span_of = latest - earliest, empty -> invalid_argument
//   closest_to(values, ref)                     - smallest |d - ref|, first wins ties, empty -> invalid_argument
//   equidistant_dates(values, ref)              - every date at that smallest distance, in input order
//
// Filters (input order is kept):
//   filter_range(values, start, end)            - start <= d <= end
//   filter_weekdays / filter_weekends
//   filter_holidays(values, holidays)           - distinct dates that appear in holidays (exact match)
//   filter_nth_weekday(values, wd, n)           - the n-th wd of its month, n in [1, 5] else value_out_of_range
//   filter_last_weekday(values, wd)             - the last wd of its month
//
// Predicates:
//   all_in_future / all_in_past(values[, now])  - now defaults to the system clock, true for empty input
//
// Grouping, groups appear in order of first occurrence of their key:
//   group_by_year / month / day / weekday / quarter / season / decade
//
// Calendar helpers:
//   quarter_of(d)      - 1..4
//   season_of(d)       - meteorological seasons of the northern hemisphere (Dec-Feb is winter)
//   decade_of(d)       - year rounded down to a multiple of 10
//   business_days_count(values)
//       - Mon..Fri days among earliest, earliest + 1 day, ..., earliest + floor((latest - earliest) / 1 day) days
//         (no holiday calendar), empty -> invalid_argument
//

namespace ax
{
using date_time = std::chrono::sys_seconds;

enum class season
{
    winter,
    spring,
    summer,
    autumn,
};

[[nodiscard]] char const* to_string(season s);

/// Throws invalid_argument for a day that does not exist in the given month
/// and value_out_of_range for a time of day outside 00:00:00 .. 23:59:59
[[nodiscard]] date_time make_date(int year, unsigned month, unsigned day, int hour = 0, int minute = 0, int second = 0);

[[nodiscard]] std::chrono::year_month_day calendar_date(date_time d);
[[nodiscard]] std::chrono::weekday weekday_of(date_time d);
[[nodiscard]] int quarter_of(date_time d);
[[nodiscard]] season season_of(date_time d);
[[nodiscard]] int decade_of(date_time d);

// extremes
[[nodiscard]] date_time earliest(span<date_time const> values);
[[nodiscard]] date_time latest(span<date_time const> values);
[[nodiscard]] std::chrono::seconds span_of(span<date_time const> values);
[[nodiscard]] date_time closest_to(span<date_time const> values, date_time reference);
[[nodiscard]] std::vector<date_time> equidistant_dates(span<date_time const> values, date_time reference);

// filters
[[nodiscard]] std::vector<date_time> filter_range(span<date_time const> values, date_time start, date_time end);
[[nodiscard]] std::vector<date_time> filter_weekdays(span<date_time const> values);
[[nodiscard]] std::vector<date_time> filter_weekends(span<date_time const> values);
[[nodiscard]] std::vector<date_time> filter_holidays(span<date_time const> values, span<date_time const> holidays);
[[nodiscard]] std::vector<date_time> filter_nth_weekday(span<date_time const> values, std::chrono::weekday wd, int n);
[[nodiscard]] std::vector<date_time> filter_last_weekday(span<date_time const> values, std::chrono::weekday wd);

// predicates
[[nodiscard]] bool all_in_future(span<date_time const> values, date_time now);
[[nodiscard]] bool all_in_future(span<date_time const> values);
[[nodiscard]] bool all_in_past(span<date_time const> values, date_time now);
[[nodiscard]] bool all_in_past(span<date_time const> values);

// grouping
template <class Key>
using date_groups = std::vector<std::pair<Key, std::vector<date_time>>>;

[[nodiscard]] date_groups<int> group_by_year(span<date_time const> values);
[[nodiscard]] date_groups<unsigned> group_by_month(span<date_time const> values);
[[nodiscard]] date_groups<unsigned> group_by_day(span<date_time const> values);
[[nodiscard]] date_groups<std::chrono::weekday> group_by_weekday(span<date_time const> values);
[[nodiscard]] date_groups<int> group_by_quarter(span<date_time const> values);
[[nodiscard]] date_groups<season> group_by_season(span<date_time const> values);
[[nodiscard]] date_groups<int> group_by_decade(span<date_time const> values);

[[nodiscard]] isize business_days_count(span<date_time const> values);
} // namespace ax
