#include "ConversionPipeline.h"

#include "ColumnDetector.h"
#include "CommonUtils.h"
#include "Mgrs2LatLongExceptions.h"
#include "MgrsClassifier.h"

#include <charconv>
#include <optional>
#include <fstream>
#include <system_error>

ConversionPipeline::ConversionPipeline(const AppConfig& config, const CoordinateConverter& converter)
    : config_(config), converter_(converter) {}

ConversionSummary ConversionPipeline::processFile(std::ostream& fallbackOut) const {
    CSVTable table(config_.delimiter);
    table.load(config_.inputPath);

    const size_t column = detectColumn(table);

    if (config_.writesToStdout()) {
        return run(table, column, fallbackOut);
    }

    std::ofstream file(config_.outputPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw Mgrs2LatLong::IOException("Failed to create output file: " + config_.outputPath);
    }
    return run(table, column, file);
}

size_t ConversionPipeline::detectColumn(const CSVTable& table) const {
    const auto detected = ColumnDetector::detectColumn(table.rows(), config_.sampleRows);
    if (!detected) {
        throw Mgrs2LatLong::DatasetException("No MGRS-like column detected in the CSV file");
    }
    return *detected;
}

ConversionSummary ConversionPipeline::run(const CSVTable& table, size_t column, std::ostream& out) const {
    ConversionSummary summary;
    summary.column = column;

    CSVUtils::writeCSVLine(out, outputHeader(table.header()), config_.delimiter);
    if (!out) throw Mgrs2LatLong::IOException("Failed to write headers");

    for (const auto& row : table.rows()) {
        CSVUtils::writeCSVLine(out, convertRow(row, column), config_.delimiter);
        if (!out) {
            throw Mgrs2LatLong::IOException("Failed to write record " + std::to_string(summary.records + 1));
        }
        ++summary.records;
    }

    out.flush();
    if (!out) throw Mgrs2LatLong::IOException("Failed to flush output");
    return summary;
}

CSVUtils::CSVRow ConversionPipeline::convertRow(const CSVUtils::CSVRow& row, size_t column) const {
    CSVUtils::CSVRow out = row;
    const std::string value = column < row.size() ? CommonUtils::trim(row[column]) : std::string();

    std::optional<GeoPair> position;
    if (!value.empty() && MgrsClassifier::looksLikeCoordinate(value)) {
        position = converter_.toLatLon(CommonUtils::removeWhitespace(value));
    }

    if (position) {
        out.push_back(formatDegrees(position->latitude));
        out.push_back(formatDegrees(position->longitude));
    } else {
        out.emplace_back();
        out.emplace_back();
    }
    return out;
}

CSVUtils::CSVRow ConversionPipeline::outputHeader(const CSVUtils::CSVRow& header) const {
    CSVUtils::CSVRow out = header;
    out.push_back(config_.latitudeHeader);
    out.push_back(config_.longitudeHeader);
    return out;
}

std::string ConversionPipeline::formatDegrees(double value) {
    char buffer[400];
    const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
    if (ec != std::errc{}) {
        throw Mgrs2LatLong::ConversionException("Cannot format coordinate value");
    }
    return std::string(buffer, ptr);
}
