// File: main.cpp
// Description: Resolves the session configuration, bootstraps logging and
//              runs the interactive classroom attendance analyzer.

#include "backend/Logger.hpp"
#include "frontend/Ansi.hpp"
#include "frontend/AppConfig.hpp"
#include "frontend/ConsoleUI.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args =
        argc > 1 ? std::vector<std::string>(argv + 1, argv + argc) : std::vector<std::string>{};
    const frontend::AppConfig config = frontend::resolveConfig(
        args, frontend::processEnvironment(), frontend::stdoutIsTerminal(), std::cerr);
    if (config.showHelp) {
        frontend::printUsage(std::cout, argv[0]);
        return 0;
    }

    try {
        backend::Logger::instance().initialize(config.logFilePath);
    } catch (const std::exception& ex) {
        std::cerr << "Logging disabled: " << ex.what() << "\n";
    }
    backend::Logger::instance().info("Starting classroom attendance analyzer.");

    if (config.useColor) {
        frontend::ansi::enableVirtualTerminalOnWindows();
    }

    frontend::ConsoleOptions options;
    options.useColor = config.useColor;
    options.absenceThreshold = config.absenceThreshold;
    options.minStreak = config.minStreak;

    try {
        frontend::ConsoleUI ui(std::cin, std::cout, options);
        const int exitCode = ui.run();
        backend::Logger::instance().info("Session finished with exit code " +
                                         std::to_string(exitCode) + ".");
        return exitCode;
    } catch (const std::exception& ex) {
        backend::Logger::instance().error(std::string("Session terminated: ") + ex.what());
        std::cerr << "Session terminated: " << ex.what() << "\n";
        return 1;
    }
}
