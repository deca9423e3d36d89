#pragma once
#include "AppConfig.h"
#include "CSVTable.h"
#include "CSVUtils.h"
#include "CoordinateConverter.h"

#include <ostream>
#include <string>

struct ConversionSummary {
    size_t records = 0;
    size_t column = 0;
};

/**
 * @brief Detects the grid-reference column and appends Latitude/Longitude to every row.
 * @details Row-level conversion failures only blank the two appended fields;
 *          everything that prevents a complete output is thrown.
 */
class ConversionPipeline {
public:
    ConversionPipeline(const AppConfig& config, const CoordinateConverter& converter);

    /**
     * @brief Runs load, detection and streaming for config.inputPath.
     * @param fallbackOut Receives the CSV when no output path is configured.
     * @post The output file is only created after a column has been detected.
     * @throws Mgrs2LatLong::IOException / Mgrs2LatLong::DatasetException on fatal conditions.
     */
    ConversionSummary processFile(std::ostream& fallbackOut) const;

    /**
     * @throws Mgrs2LatLong::DatasetException when no column looks like grid references.
     */
    size_t detectColumn(const CSVTable& table) const;

    ConversionSummary run(const CSVTable& table, size_t column, std::ostream& out) const;

    CSVUtils::CSVRow convertRow(const CSVUtils::CSVRow& row, size_t column) const;
    CSVUtils::CSVRow outputHeader(const CSVUtils::CSVRow& header) const;

    // Shortest decimal text that parses back to the same double.
    static std::string formatDegrees(double value);

private:
    const AppConfig& config_;
    const CoordinateConverter& converter_;
};
