#include "trip_time.h"

namespace {

constexpr long long kSecondsPerDay = 86400;

// Reads `len` digits starting at `pos`, -1 if any of them is not a digit
int readNumber(const std::string& text, size_t pos, size_t len) {
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return -1;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar
long long daysFromCivil(int year, int month, int day) {
    long long y = year - (month <= 2 ? 1 : 0);
    long long era = (y >= 0 ? y : y - 399) / 400;
    long long yoe = y - era * 400;                                   // [0, 399]
    long long doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
    return era * 146097 + doe - 719468;
}

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // namespace

TimeParseError::TimeParseError(const std::string& text)
    : std::runtime_error("invalid timestamp '" + text + "', expected YYYY-MM-DD HH:MM:SS") {}

TripTime TripTime::parse(const std::string& text) {
    // Layout: YYYY-MM-DD HH:MM:SS
    //         0123456789012345678
    if (text.size() != 19 ||
        text[4] != '-' || text[7] != '-' || text[10] != ' ' ||
        text[13] != ':' || text[16] != ':') {
        throw TimeParseError(text);
    }

    int year = readNumber(text, 0, 4);
    int month = readNumber(text, 5, 2);
    int day = readNumber(text, 8, 2);
    int hour = readNumber(text, 11, 2);
    int minute = readNumber(text, 14, 2);
    int second = readNumber(text, 17, 2);

    if (year < 0 || month < 0 || day < 0 || hour < 0 || minute < 0 || second < 0) {
        throw TimeParseError(text);
    }

    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        throw TimeParseError(text);
    }

    if (hour > 23 || minute > 59 || second > 59) {
        throw TimeParseError(text);
    }

    long long days = daysFromCivil(year, month, day);
    return TripTime(days * kSecondsPerDay + hour * 3600LL + minute * 60LL + second);
}

int TripTime::hour() const {
    long long secondOfDay = seconds - floorDiv(seconds, kSecondsPerDay) * kSecondsPerDay;
    return static_cast<int>(secondOfDay / 3600);
}

int TripTime::weekday() const {
    // 1970-01-01 was a Thursday
    long long days = floorDiv(seconds, kSecondsPerDay);
    long long sinceThursday = ((days % 7) + 7) % 7;
    return static_cast<int>((sinceThursday + 3) % 7 + 1);
}

long long durationSeconds(const TripTime& from, const TripTime& to) {
    return to.epochSeconds() - from.epochSeconds();
}
