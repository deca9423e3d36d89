#include "TerminalUI.h"

void TerminalUI::printUsage(std::ostream& os, const std::string& prog) {
    os << "Convert MGRS coordinates to latitude/longitude in CSV files\n\n"
       << "Usage: " << prog << " <input.csv> [options]\n\n"
       << "Arguments:\n"
       << "  <input.csv>              Input CSV file path\n\n"
       << "Options:\n"
       << "  -o, --output <file>      Output CSV file path (defaults to stdout)\n"
       << "  -h, --help               Show this help message\n";
}

void TerminalUI::printSummary(std::ostream& os, const ConversionSummary& summary) {
    os << "Processed " << summary.records << " records. MGRS column detected at index "
       << summary.column << ".\n";
    os.flush();
}

void TerminalUI::printError(std::ostream& os, const std::string& message) {
    os << "[mgrs2latlong Error] " << message << "\n";
}

void TerminalUI::printException(std::ostream& os, const std::string& message) {
    os << "[mgrs2latlong Exception] " << message << "\n";
}
