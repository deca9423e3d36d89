#include "CSVUtils.h"

namespace CSVUtils {
void skipBOM(std::istream& is) {
    if (!is.good()) return;

    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) {
        return;
    }

    is.get();
    const int second = is.peek();
    if (second == EOF || static_cast<unsigned char>(second) != 0xBB) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        return;
    }

    is.get();
    const int third = is.peek();
    if (third == EOF || static_cast<unsigned char>(third) != 0xBF) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        is.unget();
        return;
    }

    is.get();
}

namespace {
// Per-record parse state shared by the field readers below.
struct RecordReader {
    std::istream& is;
    char delimiter;
    const ParseLimits& limits;

    size_t recordBytes = 0;
    bool overLimit = false;
    bool unterminated = false;
    bool atLineEnd = false;

    bool take(char& c) {
        if (!is.get(c)) return false;
        if (limits.maxRecordBytes > 0 && ++recordBytes > limits.maxRecordBytes) {
            overLimit = true;
            return false;
        }
        return true;
    }

    bool append(std::string& field, char c) {
        field += c;
        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) {
            overLimit = true;
            return false;
        }
        return true;
    }

    // Consumes the '\n' of a CRLF pair, if present.
    void swallowLf() {
        if (is.peek() == '\n') {
            is.get();
            ++recordBytes;
        }
    }

    bool closesQuote() {
        const int next = is.peek();
        return next == EOF || next == delimiter || next == '\n' || next == '\r';
    }

    // Reads one field; returns true when a delimiter follows it.
    bool readField(std::string& field) {
        char c;
        if (is.peek() == '"') {
            if (!take(c)) return false;
            return readQuoted(field);
        }
        while (take(c)) {
            if (c == delimiter) return true;
            if (c == '\r' || c == '\n') {
                if (c == '\r') swallowLf();
                atLineEnd = true;
                return false;
            }
            if (!append(field, c)) return false;
        }
        return false;
    }

    bool readQuoted(std::string& field) {
        char c;
        while (take(c)) {
            if (c == '"') {
                if (is.peek() == '"') {
                    if (!take(c)) return false;
                    if (!append(field, '"')) return false;
                    continue;
                }
                if (closesQuote()) return readRest();
                if (!append(field, c)) return false;
                continue;
            }
            if (c == '\r' && is.peek() == '\n') {
                if (!append(field, c)) return false;
                if (!take(c)) return false;
            }
            if (!append(field, c)) return false;
        }
        if (!overLimit) unterminated = true;
        return false;
    }

    // After a closing quote only a delimiter or line end can follow.
    bool readRest() {
        char c;
        if (!take(c)) return false;
        if (c == delimiter) return true;
        if (c == '\r') swallowLf();
        atLineEnd = true;
        return false;
    }
};
} // namespace

CSVRow parseCSVLine(std::istream& is,
                    char delimiter,
                    bool* malformed,
                    bool* limitExceeded,
                    const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (limitExceeded) *limitExceeded = false;
    if (is.peek() == EOF) return {};

    RecordReader reader{is, delimiter, limits};
    CSVRow row;
    const bool firstFieldQuoted = is.peek() == '"';
    bool moreFields = true;

    while (moreFields) {
        std::string field;
        moreFields = reader.readField(field);
        row.push_back(std::move(field));
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) reader.overLimit = true;
        if (reader.overLimit) break;
        // A trailing delimiter at end of input still closes an empty last field.
        if (moreFields && is.peek() == EOF) {
            row.emplace_back();
            break;
        }
    }

    if (reader.unterminated && malformed) *malformed = true;
    if (reader.overLimit && limitExceeded) *limitExceeded = true;

    // An empty physical line is not a record.
    if (row.size() == 1 && row[0].empty() && !firstFieldQuoted && reader.atLineEnd) {
        return {};
    }
    return row;
}

bool needsQuoting(const std::string& field, char delimiter) {
    for (char c : field) {
        if (c == delimiter || c == '"' || c == '\n' || c == '\r') return true;
    }
    return false;
}

std::string formatCSVLine(const CSVRow& fields, char delimiter) {
    std::string line;
    // A lone empty field would otherwise serialize as a blank line.
    if (fields.size() == 1 && fields[0].empty()) return "\"\"";

    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += delimiter;
        const std::string& field = fields[i];
        if (!needsQuoting(field, delimiter)) {
            line += field;
            continue;
        }
        line += '"';
        for (char c : field) {
            if (c == '"') line += '"';
            line += c;
        }
        line += '"';
    }
    return line;
}

void writeCSVLine(std::ostream& os, const CSVRow& fields, char delimiter) {
    os << formatCSVLine(fields, delimiter) << '\n';
}
} // namespace CSVUtils
