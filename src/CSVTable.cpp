#include "CSVTable.h"
#include "Mgrs2LatLongExceptions.h"

#include <fstream>

CSVTable::CSVTable(char delimiter) : delimiter_(delimiter) {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw Mgrs2LatLong::DatasetException("Invalid delimiter character");
    }
}

void CSVTable::load(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw Mgrs2LatLong::IOException("Failed to open input file: " + filename);
    }
    load(file, filename);
}

void CSVTable::load(std::istream& is, const std::string& sourceName) {
    header_.clear();
    rows_.clear();

    CSVUtils::skipBOM(is);
    header_ = readHeader(is, sourceName);

    size_t recordNumber = 1; // header
    while (is.peek() != EOF) {
        bool malformed = false;
        bool limitExceeded = false;
        auto row = CSVUtils::parseCSVLine(is, delimiter_, &malformed, &limitExceeded);
        ++recordNumber;
        if (limitExceeded) {
            throw Mgrs2LatLong::DatasetException("Failed to read CSV record " + std::to_string(recordNumber) +
                                                 " in " + sourceName + ": record exceeds parser limits");
        }
        if (malformed) {
            throw Mgrs2LatLong::DatasetException("Failed to read CSV record " + std::to_string(recordNumber) +
                                                 " in " + sourceName + ": unterminated quoted field");
        }
        if (row.empty()) continue;

        fitToHeader(row, recordNumber, sourceName);
        rows_.push_back(std::move(row));
    }

    if (is.bad()) {
        throw Mgrs2LatLong::IOException("Failed while reading " + sourceName);
    }
}

CSVUtils::CSVRow CSVTable::readHeader(std::istream& is, const std::string& sourceName) {
    // Blank leading lines are not a header.
    while (is.peek() != EOF) {
        bool malformed = false;
        bool limitExceeded = false;
        auto header = CSVUtils::parseCSVLine(is, delimiter_, &malformed, &limitExceeded);
        if (malformed || limitExceeded) {
            throw Mgrs2LatLong::DatasetException("Failed to read CSV header in " + sourceName);
        }
        if (!header.empty()) return header;
    }
    if (is.bad()) {
        throw Mgrs2LatLong::IOException("Failed to read CSV header in " + sourceName);
    }
    return {};
}

void CSVTable::fitToHeader(CSVUtils::CSVRow& row, size_t recordNumber, const std::string& sourceName) const {
    const size_t expected = header_.size();
    if (row.size() == expected) return;

    if (row.size() < expected) {
        row.resize(expected);
        return;
    }

    size_t tail = row.size();
    while (tail > expected && row[tail - 1].empty()) tail--;
    if (tail == expected) {
        row.resize(expected);
        return;
    }

    throw Mgrs2LatLong::DatasetException("Failed to read CSV record " + std::to_string(recordNumber) +
                                         " in " + sourceName + ": found " + std::to_string(row.size()) +
                                         " fields but the header declares " + std::to_string(expected));
}
