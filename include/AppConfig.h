#pragma once
#include "ColumnDetector.h"

#include <string>

struct AppConfig {
    std::string inputPath;
    std::string outputPath; // empty => standard output
    bool showHelp = false;

    char delimiter = ',';
    size_t sampleRows = ColumnDetector::kDefaultSampleRows;
    std::string latitudeHeader = "Latitude";
    std::string longitudeHeader = "Longitude";

    /**
     * @brief Builds config from the command line.
     * @details Accepts one positional input path, -o/--output <path> and -h/--help.
     * @throws Mgrs2LatLong::ConfigurationException on unknown flags, a missing
     *         input path or a flag without its value.
     */
    static AppConfig fromArgs(int argc, char* argv[]);

    /**
     * @throws Mgrs2LatLong::ConfigurationException when no input path was given.
     * @note The delimiter is checked where it is used, by CSVTable.
     */
    void validate() const;

    bool writesToStdout() const noexcept { return outputPath.empty(); }
};
