#include "analyzer.h"
#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

static const char* kVersion = "1.0";

static void printUsage(std::ostream& out) {
    out << "trip_duration " << kVersion << "\n"
        << "Analyze yellow cab trip records\n\n"
        << "USAGE:\n"
        << "    trip_duration [OPTIONS] <INFILE>\n\n"
        << "ARGS:\n"
        << "    <INFILE>    Sets the input CSV file\n\n"
        << "OPTIONS:\n"
        << "    -h, --help       Prints help information\n"
        << "    -V, --version    Prints version information\n";
}

static void printCounts(const RunningCounts& c) {
    std::cout << "RECORDS\n";
    std::cout << "read," << c.read << "\n";
    std::cout << "matched," << c.matched << "\n";
    std::cout << "skipped," << c.skipped << "\n";
}

static void printHours(const HourlyHistograms& hourly) {
    std::cout << "HOUR,COUNT,MEAN,P50,P90,P99,MAX\n";
    for (int h = 0; h < hourly.size(); ++h) {
        const DurationHistogram& slot = hourly.at(h);
        if (slot.totalCount() == 0) {
            continue;
        }
        char mean[32];
        std::snprintf(mean, sizeof(mean), "%.1f", slot.mean());
        std::cout << h << "," << slot.totalCount() << "," << mean << ","
                  << slot.valueAtPercentile(50.0) << ","
                  << slot.valueAtPercentile(90.0) << ","
                  << slot.valueAtPercentile(99.0) << ","
                  << slot.max() << "\n";
    }
}

int main(int argc, char* argv[]) {
    std::string infile;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(std::cout);
            return 0;
        }
        if (arg == "-V" || arg == "--version") {
            std::cout << "trip_duration " << kVersion << "\n";
            return 0;
        }
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "error: unknown option '" << arg << "'\n\n";
            printUsage(std::cerr);
            return 1;
        }
        if (!infile.empty()) {
            std::cerr << "error: unexpected argument '" << arg << "'\n\n";
            printUsage(std::cerr);
            return 1;
        }
        infile = arg;
    }

    if (infile.empty()) {
        std::cerr << "error: the following required arguments were not provided: <INFILE>\n\n";
        printUsage(std::cerr);
        return 1;
    }

    std::cout << "INFILE: " << infile << "\n";

    auto t0 = std::chrono::high_resolution_clock::now();

    try {
        TripDurationAnalyzer analyzer;
        analyzer.ingestFile(infile);

        printCounts(analyzer.counts());
        printHours(analyzer.histograms());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();

    std::cout << "EXEC_MS\n" << ms << "\n";
    return 0;
}
