#include "DateUtils.h"
#include "CommonUtils.h"

#include <cstdio>

namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool validTimePart(const std::string& timePart) {
    if (timePart.empty()) return true;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (timePart.size() != 8) return false;
    if (!parseFixedInt(timePart, 0, 2, hour) || timePart[2] != ':' ||
        !parseFixedInt(timePart, 3, 2, minute) || timePart[5] != ':' ||
        !parseFixedInt(timePart, 6, 2, second)) {
        return false;
    }
    return hour <= 23 && minute <= 59 && second <= 60;
}

bool validCalendar(const DateUtils::CivilDate& d) {
    if (d.month < 1 || d.month > 12) return false;
    return d.day >= 1 && d.day <= DateUtils::daysInMonth(d.year, d.month);
}
} // namespace

namespace DateUtils {

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civilFromDays(int64_t days) {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
    return CivilDate{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

bool parseIsoDate(const std::string& text, CivilDate& out) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
    CivilDate d;
    if (!parseFixedInt(text, 0, 4, d.year) ||
        !parseFixedInt(text, 5, 2, d.month) ||
        !parseFixedInt(text, 8, 2, d.day)) {
        return false;
    }
    if (!validCalendar(d)) return false;
    out = d;
    return true;
}

bool parseDate(const std::string& text, CivilDate& out) {
    const std::string s = CommonUtils::trim(text);
    if (s.empty()) return false;

    std::string datePart = s;
    std::string timePart;
    const size_t sep = s.find_first_of(" T", 10);
    if (sep != std::string::npos) {
        datePart = s.substr(0, sep);
        timePart = s.substr(sep + 1);
    }
    if (!validTimePart(timePart)) return false;

    if (parseIsoDate(datePart, out)) return true;

    // Slash format: mm/dd/yyyy unless the first field can only be a day.
    if (datePart.size() == 10 && datePart[2] == '/' && datePart[5] == '/') {
        int a = 0;
        int b = 0;
        CivilDate d;
        if (!parseFixedInt(datePart, 0, 2, a) ||
            !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, d.year)) {
            return false;
        }
        if (a > 12 && b <= 12) {
            d.day = a;
            d.month = b;
        } else {
            d.month = a;
            d.day = b;
        }
        if (!validCalendar(d)) return false;
        out = d;
        return true;
    }
    return false;
}

std::string formatIsoDate(const CivilDate& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

CivilDate truncate(const CivilDate& date, Granularity granularity) {
    switch (granularity) {
        case Granularity::DAY:
            return date;
        case Granularity::WEEK: {
            const int64_t days = daysFromCivil(date.year, static_cast<unsigned>(date.month), static_cast<unsigned>(date.day));
            // 1970-01-01 was a Thursday; Monday=0.
            const int64_t weekday = ((days + 3) % 7 + 7) % 7;
            return civilFromDays(days - weekday);
        }
        case Granularity::MONTH:
            return CivilDate{date.year, date.month, 1};
        case Granularity::QUARTER:
            return CivilDate{date.year, ((date.month - 1) / 3) * 3 + 1, 1};
        case Granularity::YEAR:
            return CivilDate{date.year, 1, 1};
    }
    return date;
}

const char* granularityName(Granularity granularity) {
    switch (granularity) {
        case Granularity::DAY: return "day";
        case Granularity::WEEK: return "week";
        case Granularity::MONTH: return "month";
        case Granularity::QUARTER: return "quarter";
        case Granularity::YEAR: return "year";
    }
    return "unknown";
}

std::optional<Granularity> parseGranularity(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    if (n == "day") return Granularity::DAY;
    if (n == "week") return Granularity::WEEK;
    if (n == "month") return Granularity::MONTH;
    if (n == "quarter") return Granularity::QUARTER;
    if (n == "year") return Granularity::YEAR;
    return std::nullopt;
}

} // namespace DateUtils
