#include "date_codec.h"

#include <chrono>
#include <ctime>
#include <stdexcept>

namespace untis {

static std::string twoDigits(int x) {
    if (x < 10) return "0" + std::to_string(x);
    return std::to_string(x);
}

// Дальше ~10000 лет в любую сторону не сдвигаем
constexpr long long kMaxOffsetDays = 10000LL * 366;

static std::tm toTm(const CalendarDate& date) {
    std::tm tm{};
    tm.tm_year  = date.year - 1900;
    tm.tm_mon   = date.month - 1;
    tm.tm_mday  = date.day;
    tm.tm_hour  = 12; // полдень, чтобы переход на летнее время не сдвигал день
    tm.tm_isdst = -1;
    return tm;
}

static CalendarDate fromTm(const std::tm& tm) {
    return CalendarDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

int encodeDate(const CalendarDate& date) {
    if (date.year < 0 || date.year > 9999) {
        throw std::out_of_range("year " + std::to_string(date.year) + " does not fit YYYYMMDD");
    }
    return date.year * 10000 + date.month * 100 + date.day;
}

CalendarDate applyOffset(const CalendarDate& baseDate, int offsetDays) {
    std::tm tm = toTm(baseDate);

    long long mday = static_cast<long long>(tm.tm_mday) + offsetDays;
    if (mday > kMaxOffsetDays || mday < -kMaxOffsetDays) {
        throw std::out_of_range("date offset " + std::to_string(offsetDays) + " days is out of range");
    }
    tm.tm_mday = static_cast<int>(mday);

    // mktime нормализует день/месяц/год
    if (std::mktime(&tm) == static_cast<std::time_t>(-1)) {
        throw std::out_of_range("cannot normalize " + formatDate(baseDate) + " + " + std::to_string(offsetDays) + " days");
    }
    return fromTm(tm);
}

CalendarDate today() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return fromTm(tm);
}

bool isValidDate(const CalendarDate& date) {
    if (date.year < 0 || date.year > 9999 ||
        date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        return false;
    }
    // 2025-02-30 после нормализации станет 2025-03-02
    try {
        return applyOffset(date, 0) == date;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string formatDate(const CalendarDate& date) {
    return std::to_string(date.year) + "-" + twoDigits(date.month) + "-" + twoDigits(date.day);
}

std::string formatLongDate(const CalendarDate& date) {
    std::tm tm = toTm(date);
    // заполняет tm_wday
    if (std::mktime(&tm) == static_cast<std::time_t>(-1)) {
        return formatDate(date);
    }

    static const char* const weekdays[] = {
        "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
    };
    static const char* const months[] = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"
    };

    CalendarDate d = fromTm(tm);
    return std::string(weekdays[tm.tm_wday]) + ", " + std::to_string(d.day) + " "
         + months[d.month - 1] + " " + std::to_string(d.year);
}

} // namespace untis
