// File: AppConfig.hpp
// Description: Declares the session configuration resolved from environment
//              variables and command-line arguments.

#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace frontend {

struct AppConfig {
    std::string logFilePath{"logs/attendance.log"};
    bool useColor{true};
    bool showHelp{false};
    std::optional<double> absenceThreshold;
    std::optional<int> minStreak;
};

// Returns the value of the named environment variable, or nullopt if unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup processEnvironment();
bool stdoutIsTerminal();

// Environment first, then args (program name excluded) override it. Invalid
// values are reported on diagnostics and ignored.
AppConfig resolveConfig(const std::vector<std::string>& args,
                        const EnvLookup& getEnv,
                        bool outputIsTerminal,
                        std::ostream& diagnostics);

void printUsage(std::ostream& out, const std::string& program);

}  // namespace frontend
