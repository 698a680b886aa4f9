#pragma once
#include <stdexcept>
#include <string>

// Thrown when a timestamp is not "YYYY-MM-DD HH:MM:SS" or is not a real date/time
class TimeParseError : public std::runtime_error {
public:
    explicit TimeParseError(const std::string& text);
};

// Timezone-naive timestamp with one second resolution.
// Stored as seconds since 1970-01-01 00:00:00 on the same naive clock.
class TripTime {
public:
    // Strict "YYYY-MM-DD HH:MM:SS", throws TimeParseError otherwise
    static TripTime parse(const std::string& text);

    long long epochSeconds() const { return seconds; }

    int hour() const;      // 0-23
    int weekday() const;   // Monday = 1 ... Sunday = 7

private:
    explicit TripTime(long long s) : seconds(s) {}

    long long seconds;
};

// Signed difference (to - from) in whole seconds
long long durationSeconds(const TripTime& from, const TripTime& to);
