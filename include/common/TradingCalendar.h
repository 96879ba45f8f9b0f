#pragma once

#include <optional>
#include <string>

namespace signalbench {

// Calendar date (proleptic Gregorian). One bar = one trading day.
struct Date {
    int year;
    int month;
    int day;

    Date() : year(1970), month(1), day(1) {}
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    // Days since 1970-01-01
    long long toDays() const;
    static Date fromDays(long long days);

    // 0 = Monday ... 6 = Sunday
    int weekday() const;

    std::string toString() const;

    // Accepts "YYYY-MM-DD" (anything after the 10th character is ignored,
    // so "2024-01-10 00:00:00" parses as well).
    static std::optional<Date> parse(const std::string& text);

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

// Trading-day arithmetic shared by the simulated horizon and the live
// position horizon. Skips Saturday/Sunday only; there is no holiday calendar.
class TradingCalendar {
public:
    static bool isWeekend(const Date& date);

    static Date nextTradingDate(const Date& date);
    static Date addTradingDays(const Date& date, int trading_days);

    // Calendar month arithmetic, day clamped to the end of the target month
    static Date subtractMonths(const Date& date, int months);

    static int daysInMonth(int year, int month);
    static bool isLeapYear(int year);
};

} // namespace signalbench
