#include "record_source.h"
#include <limits>
#include <vector>

using namespace std;

namespace {

const char* const kPickupTimeHeader = "tpep_pickup_datetime";
const char* const kDropoffTimeHeader = "tpep_dropoff_datetime";
const char* const kPickupZoneHeader = "PULocationID";
const char* const kDropoffZoneHeader = "DOLocationID";

// Splits on every comma, empty fields included
vector<string> splitFields(const string& line) {
    vector<string> fields;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        if (comma == string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return fields;
}

void stripCarriageReturn(string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

size_t findColumn(const vector<string>& header, const char* name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return i;
        }
    }
    throw RecordDecodeError(1, string("missing column ") + name);
}

uint32_t parseZone(const string& field, size_t line, const char* column) {
    if (field.empty()) {
        throw RecordDecodeError(line, string("empty ") + column);
    }

    uint64_t value = 0;
    for (char c : field) {
        if (c < '0' || c > '9') {
            throw RecordDecodeError(line, string(column) + " is not an unsigned integer: '" + field + "'");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > numeric_limits<uint32_t>::max()) {
            throw RecordDecodeError(line, string(column) + " out of range: '" + field + "'");
        }
    }
    return static_cast<uint32_t>(value);
}

} // namespace

RecordDecodeError::RecordDecodeError(size_t line, const string& what)
    : runtime_error("line " + to_string(line) + ": " + what), lineNumber(line) {}

CsvRecordSource::CsvRecordSource(istream& input) : in(input) {
    readHeader();
}

CsvRecordSource::CsvRecordSource(const string& csvPath) : file(csvPath), in(file) {
    if (!file.is_open()) {
        throw RecordDecodeError(0, "failed to open " + csvPath);
    }
    readHeader();
}

void CsvRecordSource::readHeader() {
    string line;
    if (!getline(in, line)) {
        throw RecordDecodeError(1, "missing header row");
    }
    currentLine = 1;
    stripCarriageReturn(line);

    // Spreadsheet exports may start with a UTF-8 byte order mark
    if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    vector<string> header = splitFields(line);
    fieldCount = header.size();
    pickupTimeColumn = findColumn(header, kPickupTimeHeader);
    dropoffTimeColumn = findColumn(header, kDropoffTimeHeader);
    pickupZoneColumn = findColumn(header, kPickupZoneHeader);
    dropoffZoneColumn = findColumn(header, kDropoffZoneHeader);
}

bool CsvRecordSource::next(TripRecord& out) {
    string line;
    while (getline(in, line)) {
        ++currentLine;
        stripCarriageReturn(line);
        if (line.empty()) {
            continue;
        }

        vector<string> fields = splitFields(line);
        if (fields.size() != fieldCount) {
            throw RecordDecodeError(currentLine, "expected " + to_string(fieldCount) +
                                    " fields, found " + to_string(fields.size()));
        }

        out.pickupTime = fields[pickupTimeColumn];
        out.dropoffTime = fields[dropoffTimeColumn];
        if (out.pickupTime.empty()) {
            throw RecordDecodeError(currentLine, string("empty ") + kPickupTimeHeader);
        }
        if (out.dropoffTime.empty()) {
            throw RecordDecodeError(currentLine, string("empty ") + kDropoffTimeHeader);
        }
        out.pickupZone = parseZone(fields[pickupZoneColumn], currentLine, kPickupZoneHeader);
        out.dropoffZone = parseZone(fields[dropoffZoneColumn], currentLine, kDropoffZoneHeader);
        return true;
    }

    if (in.bad()) {
        throw RecordDecodeError(currentLine, "read error");
    }
    return false;
}
