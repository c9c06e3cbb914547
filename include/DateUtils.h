#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace DateUtils {

struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

enum class Granularity { DAY, WEEK, MONTH, QUARTER, YEAR };

bool isLeapYear(int year);
int daysInMonth(int year, int month);

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
int64_t daysFromCivil(int y, unsigned m, unsigned d);
CivilDate civilFromDays(int64_t days);

/**
 * @brief Parses ISO (YYYY-MM-DD, optional " HH:MM:SS" or "THH:MM:SS" suffix) and
 *        slash (MM/DD/YYYY, DD/MM/YYYY when the first field exceeds 12) dates.
 * @post Returns false for malformed or out-of-calendar input.
 */
bool parseDate(const std::string& text, CivilDate& out);

/**
 * @brief Strict YYYY-MM-DD check used by the range codec; no time part, no slash forms.
 */
bool parseIsoDate(const std::string& text, CivilDate& out);

std::string formatIsoDate(const CivilDate& date);

/**
 * @brief Truncates a date to the start of its granularity bucket.
 * @details WEEK truncates to the Monday of the ISO week.
 */
CivilDate truncate(const CivilDate& date, Granularity granularity);

const char* granularityName(Granularity granularity);
std::optional<Granularity> parseGranularity(const std::string& name);

} // namespace DateUtils
