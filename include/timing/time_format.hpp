#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace cadence {

constexpr char DEFAULT_DATE_FORMAT[] = "%Y-%m-%d";
constexpr char DEFAULT_TIME_FORMAT[] = "%H:%M:%S";
constexpr char DEFAULT_INSTANT_FORMAT[] = "%Y-%m-%d %H:%M:%S";

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 7 * SECONDS_PER_DAY;

namespace timeformat {

// Builds a fully populated std::tm (weekday and day-of-year included) for strftime-style output
std::tm makeTm(int year, int month, int day, int hour, int minute, int second);

// Formats with the classic "C" locale so output does not depend on the environment
std::string format(const std::tm& tm, const std::string& pattern);

// Parses text against pattern. Fields the pattern does not mention keep their
// defaults (1900-01-01 00:00:00). Fails on input shorter than the pattern and
// on anything but whitespace after it.
bool parse(const std::string& text, const std::string& pattern, std::tm& out);

// Reads the local wall clock
std::tm localNow();

} // namespace timeformat
} // namespace cadence
