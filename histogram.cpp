#include "histogram.h"
#include "trip_time.h"
#include <algorithm>
#include <limits>
#include <string>

using namespace std;

namespace {

// Number of bits needed to represent v (0 for 0)
int bitLength(uint64_t v) {
    int bits = 0;
    while (v != 0) {
        v >>= 1;
        ++bits;
    }
    return bits;
}

} // namespace

DurationHistogram::DurationHistogram(int64_t lowest, int64_t highest, int significantDigits)
    : lowestValue(lowest), highestValue(highest), digits(significantDigits) {
    if (lowest < 1) {
        throw HistogramConfigError("lowest trackable value must be >= 1, got " + to_string(lowest));
    }
    if (highest < 2 * lowest) {
        throw HistogramConfigError("highest trackable value " + to_string(highest) +
                                   " must be at least twice the lowest " + to_string(lowest));
    }
    if (significantDigits < 1 || significantDigits > 5) {
        throw HistogramConfigError("significant digits must be in 1..5, got " +
                                   to_string(significantDigits));
    }

    int64_t largestValueWithSingleUnitResolution = 2;
    for (int i = 0; i < significantDigits; ++i) {
        largestValueWithSingleUnitResolution *= 10;
    }

    // Smallest power of two covering the single unit resolution range
    int subBucketCountMagnitude = 0;
    while ((int64_t(1) << subBucketCountMagnitude) < largestValueWithSingleUnitResolution) {
        ++subBucketCountMagnitude;
    }

    unitMagnitude = bitLength(static_cast<uint64_t>(lowest)) - 1;
    if (unitMagnitude + subBucketCountMagnitude > 62) {
        throw HistogramConfigError("lowest trackable value " + to_string(lowest) +
                                   " is too large for " + to_string(significantDigits) +
                                   " significant digits");
    }

    subBucketHalfCountMagnitude = subBucketCountMagnitude - 1;
    subBucketCount = int64_t(1) << subBucketCountMagnitude;
    subBucketHalfCount = subBucketCount / 2;
    subBucketMask = (subBucketCount - 1) << unitMagnitude;

    // Each bucket doubles the covered range
    int64_t smallestUntrackableValue = subBucketCount << unitMagnitude;
    int bucketCount = 1;
    while (smallestUntrackableValue <= highest) {
        if (smallestUntrackableValue > numeric_limits<int64_t>::max() / 2) {
            ++bucketCount;
            break;
        }
        smallestUntrackableValue <<= 1;
        ++bucketCount;
    }

    counts.assign(static_cast<size_t>(bucketCount + 1) * static_cast<size_t>(subBucketHalfCount), 0);
}

int DurationHistogram::bucketIndexOf(int64_t value) const {
    int pow2Ceiling = bitLength(static_cast<uint64_t>(value | subBucketMask));
    return pow2Ceiling - unitMagnitude - (subBucketHalfCountMagnitude + 1);
}

size_t DurationHistogram::countsIndex(int64_t value) const {
    int bucketIndex = bucketIndexOf(value);
    int64_t subBucketIndex = value >> (bucketIndex + unitMagnitude);
    int64_t bucketBase = int64_t(bucketIndex + 1) << subBucketHalfCountMagnitude;
    return static_cast<size_t>(bucketBase + (subBucketIndex - subBucketHalfCount));
}

int64_t DurationHistogram::valueFromIndex(size_t index) const {
    int bucketIndex = static_cast<int>(index >> subBucketHalfCountMagnitude) - 1;
    int64_t subBucketIndex = static_cast<int64_t>(index & static_cast<size_t>(subBucketHalfCount - 1)) +
                             subBucketHalfCount;
    if (bucketIndex < 0) {
        subBucketIndex -= subBucketHalfCount;
        bucketIndex = 0;
    }
    return subBucketIndex << (bucketIndex + unitMagnitude);
}

int64_t DurationHistogram::sizeOfEquivalentRange(int64_t value) const {
    return int64_t(1) << (unitMagnitude + bucketIndexOf(value));
}

int64_t DurationHistogram::lowestEquivalentValue(int64_t value) const {
    return valueFromIndex(countsIndex(value));
}

int64_t DurationHistogram::highestEquivalentValue(int64_t value) const {
    return lowestEquivalentValue(value) + sizeOfEquivalentRange(value) - 1;
}

bool DurationHistogram::record(int64_t value) {
    if (value < lowestValue || value > highestValue) {
        return false;
    }

    ++counts[countsIndex(value)];

    if (total == 0 || value < minValue) {
        minValue = value;
    }
    if (total == 0 || value > maxValue) {
        maxValue = value;
    }
    ++total;
    return true;
}

int64_t DurationHistogram::countAtValue(int64_t value) const {
    if (value < lowestValue || value > highestValue) {
        return 0;
    }
    return counts[countsIndex(value)];
}

double DurationHistogram::mean() const {
    if (total == 0) {
        return 0.0;
    }

    double sum = 0.0;
    for (size_t i = 0; i < counts.size(); ++i) {
        if (counts[i] == 0) {
            continue;
        }
        int64_t value = valueFromIndex(i);
        int64_t median = value + (sizeOfEquivalentRange(value) >> 1);
        sum += static_cast<double>(counts[i]) * static_cast<double>(median);
    }
    return sum / static_cast<double>(total);
}

int64_t DurationHistogram::valueAtPercentile(double p) const {
    if (total == 0) {
        return 0;
    }

    double requested = (std::min)((std::max)(p, 0.0), 100.0);
    int64_t target = static_cast<int64_t>(requested / 100.0 * static_cast<double>(total) + 0.5);
    if (target < 1) {
        target = 1;
    }

    int64_t cumulative = 0;
    for (size_t i = 0; i < counts.size(); ++i) {
        cumulative += counts[i];
        if (cumulative >= target) {
            return (std::min)(highestEquivalentValue(valueFromIndex(i)), maxValue);
        }
    }
    return maxValue;
}

bool DurationHistogram::operator==(const DurationHistogram& other) const {
    return lowestValue == other.lowestValue &&
           highestValue == other.highestValue &&
           digits == other.digits &&
           total == other.total &&
           min() == other.min() &&
           max() == other.max() &&
           counts == other.counts;
}

const char* describe(DurationError error) {
    switch (error) {
    case DurationError::None:
        return "ok";
    case DurationError::NonPositive:
        return "dropoff not after pickup";
    case DurationError::TooShort:
        return "trip too short";
    case DurationError::TooLong:
        return "trip too long";
    }
    return "unknown";
}

HourlyHistograms::HourlyHistograms(const AnalyzerConfig& config)
    : minTripSeconds(config.minTripSeconds) {
    slots.reserve(kHours);
    for (int h = 0; h < kHours; ++h) {
        slots.emplace_back(config.lowestSeconds, config.highestSeconds, config.significantDigits);
    }
}

DurationOutcome HourlyHistograms::recordDuration(const TripTime& pickup, const TripTime& dropoff) {
    long long seconds = durationSeconds(pickup, dropoff);

    if (seconds <= 0) {
        return { DurationError::NonPositive, seconds };
    }
    if (seconds < minTripSeconds) {
        return { DurationError::TooShort, seconds };
    }

    DurationHistogram& slot = slots[static_cast<size_t>(pickup.hour())];
    if (!slot.record(seconds)) {
        // record() only rejects values outside [lowest, highest]
        DurationError error = seconds > slot.highest() ? DurationError::TooLong : DurationError::TooShort;
        return { error, seconds };
    }
    return { DurationError::None, seconds };
}

const DurationHistogram& HourlyHistograms::at(int hour) const {
    if (hour < 0 || hour >= kHours) {
        throw out_of_range("hour " + to_string(hour) + " is outside 0-23");
    }
    return slots[static_cast<size_t>(hour)];
}

int64_t HourlyHistograms::totalCount() const {
    int64_t sum = 0;
    for (const auto& slot : slots) {
        sum += slot.totalCount();
    }
    return sum;
}
