#include "common/TradingCalendar.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace signalbench {

namespace {
// Howard Hinnant's civil calendar algorithms
long long daysFromCivil(int y, int m, int d) {
    y -= (m <= 2) ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = static_cast<unsigned>(m > 2 ? m - 3 : m + 9);
    const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(d) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

int parseDigits(const std::string& text, size_t pos, size_t count, bool& ok) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            ok = false;
            return 0;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}
}

long long Date::toDays() const {
    return daysFromCivil(year, month, day);
}

Date Date::fromDays(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d));
}

int Date::weekday() const {
    // 1970-01-01 was a Thursday (index 3 with Monday = 0)
    const long long days = toDays();
    const long long wd = (days + 3) % 7;
    return static_cast<int>(wd < 0 ? wd + 7 : wd);
}

std::string Date::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

std::optional<Date> Date::parse(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    bool ok = true;
    const int y = parseDigits(text, 0, 4, ok);
    const int m = parseDigits(text, 5, 2, ok);
    const int d = parseDigits(text, 8, 2, ok);
    if (!ok || m < 1 || m > 12 || d < 1 || d > TradingCalendar::daysInMonth(y, m)) {
        return std::nullopt;
    }
    return Date(y, m, d);
}

bool TradingCalendar::isWeekend(const Date& date) {
    return date.weekday() >= 5;
}

Date TradingCalendar::nextTradingDate(const Date& date) {
    Date next = Date::fromDays(date.toDays() + 1);
    while (isWeekend(next)) {
        next = Date::fromDays(next.toDays() + 1);
    }
    return next;
}

Date TradingCalendar::addTradingDays(const Date& date, int trading_days) {
    Date current = date;
    for (int i = 0; i < trading_days; ++i) {
        current = nextTradingDate(current);
    }
    return current;
}

Date TradingCalendar::subtractMonths(const Date& date, int months) {
    int total = date.year * 12 + (date.month - 1) - months;
    const int y = total / 12;
    const int m = total % 12 + 1;
    const int d = std::min(date.day, daysInMonth(y, m));
    return Date(y, m, d);
}

int TradingCalendar::daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool TradingCalendar::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

} // namespace signalbench
