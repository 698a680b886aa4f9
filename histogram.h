#pragma once
#include "analyzer_config.h"
#include <cstdint>
#include <stdexcept>
#include <vector>

class TripTime;

class HistogramConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Log-linear bucketed counter (HdrHistogram layout).
// Values below 2 * 10^digits get their own bucket, every power of two
// above that doubles the bucket width, so a recorded value is known to
// within 10^-digits relative error.
class DurationHistogram {
public:
    // Throws HistogramConfigError for lowest < 1, highest < 2 * lowest
    // or significantDigits outside 1..5
    DurationHistogram(std::int64_t lowest, std::int64_t highest, int significantDigits);

    // False (and nothing recorded) when value is outside [lowest, highest]
    bool record(std::int64_t value);

    std::int64_t lowest() const { return lowestValue; }
    std::int64_t highest() const { return highestValue; }
    int significantDigits() const { return digits; }

    std::int64_t totalCount() const { return total; }
    std::int64_t countAtValue(std::int64_t value) const;

    // Exact extremes of what was recorded, 0 when empty
    std::int64_t min() const { return total > 0 ? minValue : 0; }
    std::int64_t max() const { return total > 0 ? maxValue : 0; }

    double mean() const;

    // p in [0, 100]; never above max()
    std::int64_t valueAtPercentile(double p) const;

    std::int64_t lowestEquivalentValue(std::int64_t value) const;
    std::int64_t highestEquivalentValue(std::int64_t value) const;

    bool operator==(const DurationHistogram& other) const;
    bool operator!=(const DurationHistogram& other) const { return !(*this == other); }

private:
    int bucketIndexOf(std::int64_t value) const;
    size_t countsIndex(std::int64_t value) const;
    std::int64_t valueFromIndex(size_t index) const;
    std::int64_t sizeOfEquivalentRange(std::int64_t value) const;

    std::int64_t lowestValue;
    std::int64_t highestValue;
    int digits;

    int unitMagnitude = 0;
    int subBucketHalfCountMagnitude = 0;
    std::int64_t subBucketCount = 0;
    std::int64_t subBucketHalfCount = 0;
    std::int64_t subBucketMask = 0;

    std::vector<std::int64_t> counts;
    std::int64_t total = 0;
    std::int64_t minValue = 0;
    std::int64_t maxValue = 0;
};

enum class DurationError {
    None,
    NonPositive,   // dropoff at or before pickup
    TooShort,      // below the minimum trip duration or the histogram range
    TooLong        // above the histogram range
};

const char* describe(DurationError error);

struct DurationOutcome {
    DurationError error;
    long long seconds;

    bool ok() const { return error == DurationError::None; }
};

// One DurationHistogram per pickup hour, all sharing the same range
class HourlyHistograms {
public:
    static constexpr int kHours = 24;

    explicit HourlyHistograms(const AnalyzerConfig& config = AnalyzerConfig());

    // Records dropoff - pickup into the slot of pickup.hour().
    // On any error every slot is left untouched.
    DurationOutcome recordDuration(const TripTime& pickup, const TripTime& dropoff);

    // Throws std::out_of_range for hour outside 0-23
    const DurationHistogram& at(int hour) const;

    int size() const { return kHours; }

    std::int64_t totalCount() const;

    bool operator==(const HourlyHistograms& other) const { return slots == other.slots; }
    bool operator!=(const HourlyHistograms& other) const { return !(*this == other); }

private:
    std::vector<DurationHistogram> slots;
    long long minTripSeconds;
};
