#pragma once // prevents multiple inclusions
#include "analyzer_config.h"
#include "histogram.h"
#include <iostream>
#include <string>

class RecordSource;
struct TripRecord;

// Tallies kept across one pass, read >= matched >= skipped
struct RunningCounts {
    long long read = 0;      // every decoded record
    long long matched = 0;   // Midtown -> JFK on a weekday
    long long skipped = 0;   // matched but duration rejected
};

// Midtown -> JFK weekday trip durations, one histogram per pickup hour
class TripDurationAnalyzer {
public:
    // Throws HistogramConfigError for an invalid histogram range.
    // Per-record warnings go to `diagnostics`.
    explicit TripDurationAnalyzer(const AnalyzerConfig& config = AnalyzerConfig(),
                                  std::ostream& diagnostics = std::cerr);

    // Scans the source to the end. RecordDecodeError and TimeParseError
    // abort the scan; rejected durations are only counted in skipped.
    void ingest(RecordSource& source);

    // Same as ingest() over a CsvRecordSource on csvPath
    void ingestFile(const std::string& csvPath);

    const RunningCounts& counts() const { return runCounts; }
    const HourlyHistograms& histograms() const { return hourly; }

private:
    void processRecord(const TripRecord& record);

    HourlyHistograms hourly;
    RunningCounts runCounts;
    std::ostream& diag;
};
