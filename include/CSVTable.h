#pragma once
#include "CSVUtils.h"

#include <istream>
#include <string>
#include <vector>

/**
 * @brief Header plus every data record of a delimited file, held in memory.
 * @details Column detection needs look-ahead over the data, so the whole table
 *          is loaded before the first output row can be written.
 */
class CSVTable {
public:
    explicit CSVTable(char delimiter = ',');

    /**
     * @brief Loads header and records from a file on disk.
     * @throws Mgrs2LatLong::IOException when the file cannot be opened or read.
     * @throws Mgrs2LatLong::DatasetException on a malformed header or record.
     */
    void load(const std::string& filename);

    /**
     * @brief Loads header and records from an already open stream.
     * @param sourceName Used in error messages only.
     */
    void load(std::istream& is, const std::string& sourceName);

    const CSVUtils::CSVRow& header() const noexcept { return header_; }
    const std::vector<CSVUtils::CSVRow>& rows() const noexcept { return rows_; }
    size_t rowCount() const noexcept { return rows_.size(); }
    size_t colCount() const noexcept { return header_.size(); }
    char delimiter() const noexcept { return delimiter_; }

private:
    char delimiter_;
    CSVUtils::CSVRow header_;
    std::vector<CSVUtils::CSVRow> rows_;

    CSVUtils::CSVRow readHeader(std::istream& is, const std::string& sourceName);
    void fitToHeader(CSVUtils::CSVRow& row, size_t recordNumber, const std::string& sourceName) const;
};
