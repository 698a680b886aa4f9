#pragma once // prevents multiple inclusions
#include <array>
#include <cstdint>

class TripTime;

// Pickup zones counted as Midtown Manhattan, kept sorted for binary search
constexpr std::array<std::uint32_t, 9> kMidtownZones = {
    90, 100, 161, 162, 163, 164, 186, 230, 234
};

// JFK Airport
constexpr std::uint32_t kJfkZone = 132;

bool isMidtownPickup(std::uint32_t zone);

bool isJfkDropoff(std::uint32_t zone);

// Monday (1) through Friday (5)
bool isWeekday(const TripTime& pickup);

// Zone part of the filter, checked before any timestamp is parsed
bool isCandidateTrip(std::uint32_t pickupZone, std::uint32_t dropoffZone);
