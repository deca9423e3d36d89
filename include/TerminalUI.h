#pragma once
#include "ConversionPipeline.h"

#include <ostream>
#include <string>

class TerminalUI {
public:
    static void printUsage(std::ostream& os, const std::string& prog);
    static void printSummary(std::ostream& os, const ConversionSummary& summary);

    // Tagged single-line diagnostics.
    static void printError(std::ostream& os, const std::string& message);
    static void printException(std::ostream& os, const std::string& message);
};
