#include "Application.h"

#include "AppConfig.h"
#include "ConversionPipeline.h"
#include "Mgrs2LatLongExceptions.h"
#include "MgrsConverter.h"
#include "TerminalUI.h"

#include <exception>
#include <string>

Application::Application(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

int Application::run(int argc, char* argv[]) {
    const std::string prog = argc > 0 ? argv[0] : "mgrs2latlong";

    AppConfig config;
    try {
        config = AppConfig::fromArgs(argc, argv);
    } catch (const Mgrs2LatLong::Mgrs2LatLongException& e) {
        TerminalUI::printError(err_, e.what());
        TerminalUI::printUsage(err_, prog);
        return 1;
    }

    if (config.showHelp) {
        TerminalUI::printUsage(out_, prog);
        return 0;
    }

    MgrsConverter converter;
    ConversionPipeline pipeline(config, converter);

    ConversionSummary summary;
    try {
        summary = pipeline.processFile(out_);
    } catch (const Mgrs2LatLong::Mgrs2LatLongException& e) {
        TerminalUI::printError(err_, e.what());
        return 1;
    } catch (const std::exception& e) {
        TerminalUI::printException(err_, e.what());
        return 1;
    }

    // Keep stdout a clean CSV stream when it carries the data.
    TerminalUI::printSummary(config.writesToStdout() ? err_ : out_, summary);
    return 0;
}
