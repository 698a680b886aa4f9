#pragma once
#include <cstdint>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>

// One decoded trip row
struct TripRecord {
    std::string pickupTime;    // YYYY-MM-DD HH:MM:SS
    std::string dropoffTime;   // YYYY-MM-DD HH:MM:SS
    std::uint32_t pickupZone = 0;
    std::uint32_t dropoffZone = 0;
};

// A row (or the header) that cannot be turned into a TripRecord
class RecordDecodeError : public std::runtime_error {
public:
    RecordDecodeError(size_t line, const std::string& what);

    size_t line() const { return lineNumber; }

private:
    size_t lineNumber;
};

class RecordSource {
public:
    virtual ~RecordSource() = default;

    // Fills `out` and returns true, false at end of input.
    // Throws RecordDecodeError for a row that cannot be decoded.
    virtual bool next(TripRecord& out) = 0;
};

// NYC TLC yellow cab CSV. Columns are located through the header row:
// tpep_pickup_datetime, tpep_dropoff_datetime, PULocationID, DOLocationID
class CsvRecordSource : public RecordSource {
public:
    explicit CsvRecordSource(std::istream& input);

    // Throws RecordDecodeError when the file cannot be opened
    explicit CsvRecordSource(const std::string& csvPath);

    bool next(TripRecord& out) override;

    size_t lineNumber() const { return currentLine; }

private:
    void readHeader();

    std::ifstream file;   // only used by the path constructor
    std::istream& in;
    size_t currentLine = 0;
    size_t fieldCount = 0;

    // Column positions from the header
    size_t pickupTimeColumn = 0;
    size_t dropoffTimeColumn = 0;
    size_t pickupZoneColumn = 0;
    size_t dropoffZoneColumn = 0;
};
