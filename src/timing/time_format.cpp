#include "timing/time_format.hpp"
#include "timing/calendar_date.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace cadence {
namespace timeformat {

std::tm makeTm(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;

    CalendarDate date(year, month, day);
    // std::tm counts weekdays from Sunday
    tm.tm_wday = (static_cast<int>(date.weekday()) + 1) % 7;
    tm.tm_yday = static_cast<int>(date.daysSinceEpoch() - CalendarDate(year, 1, 1).daysSinceEpoch());
    return tm;
}

std::string format(const std::tm& tm, const std::string& pattern) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::put_time(&tm, pattern.c_str());
    return out.str();
}

bool parse(const std::string& text, const std::string& pattern, std::tm& out) {
    std::tm tm{};
    tm.tm_mday = 1;

    // strptime fails on input that ends before the pattern does
    const char* rest = strptime(text.c_str(), pattern.c_str(), &tm);
    if (rest == nullptr) {
        return false;
    }
    while (*rest != '\0') {
        if (!std::isspace(static_cast<unsigned char>(*rest))) {
            return false;
        }
        ++rest;
    }

    out = tm;
    return true;
}

std::tm localNow() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm localTm{};
    localtime_r(&time, &localTm);
    return localTm;
}

} // namespace timeformat
} // namespace cadence
