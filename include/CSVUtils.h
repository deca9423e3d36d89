#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and serialization utilities.
// Fields are carried verbatim; this module does not interpret cell content.
using CSVRow = std::vector<std::string>;

struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxRecordBytes = 64 * 1024 * 1024;         // 64 MiB
	size_t maxColumns = 20000;
};

void skipBOM(std::istream& is);
CSVRow parseCSVLine(std::istream& is,
					char delimiter,
					bool* malformed = nullptr,
					bool* limitExceeded = nullptr,
					const ParseLimits& limits = ParseLimits{});

bool needsQuoting(const std::string& field, char delimiter);
std::string formatCSVLine(const CSVRow& fields, char delimiter);
void writeCSVLine(std::ostream& os, const CSVRow& fields, char delimiter);
}
