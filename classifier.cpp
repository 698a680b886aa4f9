#include "classifier.h"
#include "trip_time.h"
#include <algorithm>

bool isMidtownPickup(std::uint32_t zone) {
    return std::binary_search(kMidtownZones.begin(), kMidtownZones.end(), zone);
}

bool isJfkDropoff(std::uint32_t zone) {
    return zone == kJfkZone;
}

bool isWeekday(const TripTime& pickup) {
    int day = pickup.weekday();
    return day >= 1 && day <= 5;
}

bool isCandidateTrip(std::uint32_t pickupZone, std::uint32_t dropoffZone) {
    return isMidtownPickup(pickupZone) && isJfkDropoff(dropoffZone);
}
