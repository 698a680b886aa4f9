#include "analyzer.h"
#include "classifier.h"
#include "record_source.h"
#include "trip_time.h"

using namespace std;

TripDurationAnalyzer::TripDurationAnalyzer(const AnalyzerConfig& config, ostream& diagnostics)
    : hourly(config), diag(diagnostics) {}

void TripDurationAnalyzer::ingest(RecordSource& source) {
    TripRecord record;

    // Decode and timestamp errors propagate out of the loop,
    // nothing after the bad record is processed
    while (source.next(record)) {
        processRecord(record);
    }
}

void TripDurationAnalyzer::ingestFile(const string& csvPath) {
    CsvRecordSource source(csvPath);
    ingest(source);
}

void TripDurationAnalyzer::processRecord(const TripRecord& record) {
    ++runCounts.read;

    // Zone check first so non-candidate rows never touch the time parser
    if (!isCandidateTrip(record.pickupZone, record.dropoffZone)) {
        return;
    }

    TripTime pickup = TripTime::parse(record.pickupTime);
    if (!isWeekday(pickup)) {
        return;
    }

    ++runCounts.matched;

    TripTime dropoff = TripTime::parse(record.dropoffTime);
    DurationOutcome outcome = hourly.recordDuration(pickup, dropoff);
    if (!outcome.ok()) {
        ++runCounts.skipped;
        diag << "warning: record " << runCounts.read << ": " << describe(outcome.error)
             << " (" << outcome.seconds << "s, pickup " << record.pickupTime
             << "), skipped\n";
    }
}
