#pragma once

// Histogram range and trip filtering thresholds, all in seconds
struct AnalyzerConfig {
    long long lowestSeconds = 1;
    long long highestSeconds = 10800;   // 3 hours
    int significantDigits = 3;
    long long minTripSeconds = 1200;    // shorter airport runs are treated as bad data
};
