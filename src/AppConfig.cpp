#include "AppConfig.h"
#include "Mgrs2LatLongExceptions.h"

namespace {
constexpr const char* kLongOutputPrefix = "--output=";

std::string requireValue(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw Mgrs2LatLong::ConfigurationException(flag + " expects an output file path");
    }
    return argv[++i];
}
}

AppConfig AppConfig::fromArgs(int argc, char* argv[]) {
    AppConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else if (arg == "-o" || arg == "--output") {
            config.outputPath = requireValue(argc, argv, i, arg);
        } else if (arg.rfind(kLongOutputPrefix, 0) == 0) {
            config.outputPath = arg.substr(std::string(kLongOutputPrefix).size());
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw Mgrs2LatLong::ConfigurationException("Unknown argument: " + arg);
        } else if (config.inputPath.empty()) {
            config.inputPath = arg;
        } else {
            throw Mgrs2LatLong::ConfigurationException("Unexpected extra argument: " + arg);
        }
    }

    if (config.showHelp) return config;

    config.validate();
    return config;
}

void AppConfig::validate() const {
    if (inputPath.empty()) {
        throw Mgrs2LatLong::ConfigurationException("Input CSV file path is required");
    }
}
