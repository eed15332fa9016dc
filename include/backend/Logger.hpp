// File: Logger.hpp
// Description: Provides a thread-safe, leveled logging facility that writes
//              session events to a log file and optionally mirrors them to
//              the console.

#pragma once

#include <mutex>
#include <string>

namespace backend {

enum class LogLevel { Info, Warning, Error };

class Logger {
public:
    static Logger& instance();

    // Creates missing parent directories and truncates the target file.
    // Throws std::runtime_error when the file cannot be opened.
    void initialize(const std::string& logFilePath);
    void setConsoleEcho(bool enabled);
    bool isInitialized() const;
    std::string logFilePath() const;

    void log(LogLevel level, const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex m_mutex;
    std::string m_logFilePath;
    bool m_initialized{false};
    bool m_consoleEcho{false};
    struct Impl;
    Impl* m_impl{nullptr};
};

const char* toString(LogLevel level) noexcept;

}  // namespace backend
