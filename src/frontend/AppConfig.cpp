// File: AppConfig.cpp
// Description: Resolves the session configuration in env-then-argv order.

#include "frontend/AppConfig.hpp"

#include "frontend/InputParser.hpp"

#include <cstdio>
#include <cstdlib>
#include <ostream>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace frontend {

namespace {

void applyThreshold(AppConfig& config,
                    const std::string& value,
                    const char* source,
                    std::ostream& diagnostics) {
    if (const std::optional<double> parsed = parsePercentage(value)) {
        config.absenceThreshold = parsed;
        return;
    }
    diagnostics << "Invalid absence threshold from " << source << " (\"" << value
                << "\"); it will be asked for interactively.\n";
}

void applyMinStreak(AppConfig& config,
                    const std::string& value,
                    const char* source,
                    std::ostream& diagnostics) {
    if (const std::optional<int> parsed = parseNonNegativeInt(value)) {
        config.minStreak = parsed;
        return;
    }
    diagnostics << "Invalid minimum streak from " << source << " (\"" << value
                << "\"); it will be asked for interactively.\n";
}

bool takesValue(const std::string& arg) {
    return arg == "--threshold" || arg == "--min-streak" || arg == "--log";
}

}  // namespace

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

bool stdoutIsTerminal() {
#if defined(_WIN32)
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

AppConfig resolveConfig(const std::vector<std::string>& args,
                        const EnvLookup& getEnv,
                        bool outputIsTerminal,
                        std::ostream& diagnostics) {
    AppConfig config;

    if (const auto envLog = getEnv("ATTENDANCE_LOG_PATH")) {
        config.logFilePath = *envLog;
    }
    if (const auto envThreshold = getEnv("ATTENDANCE_THRESHOLD")) {
        applyThreshold(config, *envThreshold, "ATTENDANCE_THRESHOLD", diagnostics);
    }
    if (const auto envStreak = getEnv("ATTENDANCE_MIN_STREAK")) {
        applyMinStreak(config, *envStreak, "ATTENDANCE_MIN_STREAK", diagnostics);
    }
    if (getEnv("NO_COLOR")) {
        config.useColor = false;
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (takesValue(arg) && i + 1 >= args.size()) {
            diagnostics << "\"" << arg << "\" requires a value.\n";
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--no-color") {
            config.useColor = false;
        } else if (arg == "--threshold") {
            applyThreshold(config, args[++i], "--threshold", diagnostics);
        } else if (arg == "--min-streak") {
            applyMinStreak(config, args[++i], "--min-streak", diagnostics);
        } else if (arg == "--log") {
            config.logFilePath = args[++i];
        } else {
            diagnostics << "Ignoring unrecognized argument \"" << arg << "\".\n";
        }
    }

    if (!outputIsTerminal) {
        config.useColor = false;
    }
    return config;
}

void printUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program
        << " [--threshold <percent>] [--min-streak <days>] [--no-color] [--log <path>]\n";
}

}  // namespace frontend
