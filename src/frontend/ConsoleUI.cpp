// File: ConsoleUI.cpp
// Description: Implements the interactive attendance session loop.

#include "frontend/ConsoleUI.hpp"

#include "backend/AttendanceErrors.hpp"
#include "backend/Logger.hpp"
#include "frontend/InputParser.hpp"
#include "frontend/ReportRenderer.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace frontend {

ConsoleUI::ConsoleUI(std::istream& in, std::ostream& out, ConsoleOptions options)
    : m_in(in), m_out(out), m_options(std::move(options)) {}

int ConsoleUI::run() {
    m_out << "Enter students and their 30-day attendance records (Y/N or 1/0 format)\n";
    m_out << "Format: StudentName YNNYNY... (30 characters)\n";
    m_out << "Enter 'done' when finished\n\n";

    collectStudents();
    backend::Logger::instance().info("Collected " + std::to_string(m_roster.size()) +
                                     " student record(s).");

    m_out << "\nSet defaulter criteria:\n";
    const std::optional<double> threshold = askAbsenceThreshold();
    if (!threshold) {
        m_out << "\nInput ended before the criteria were entered.\n";
        backend::Logger::instance().warning("Session aborted while reading the absence threshold.");
        return 1;
    }
    const std::optional<int> minStreak = askMinStreak();
    if (!minStreak) {
        m_out << "\nInput ended before the criteria were entered.\n";
        backend::Logger::instance().warning("Session aborted while reading the minimum streak.");
        return 1;
    }

    printReport(*threshold, *minStreak);
    return 0;
}

const backend::AttendanceRoster& ConsoleUI::roster() const noexcept {
    return m_roster;
}

void ConsoleUI::collectStudents() {
    while (true) {
        m_out << "> " << std::flush;
        std::string line;
        if (!std::getline(m_in, line)) {
            m_out << "\n";
            break;
        }
        if (isDoneCommand(line)) {
            break;
        }
        if (trim(line).empty()) {
            continue;
        }
        handleStudentLine(line);
    }
}

void ConsoleUI::handleStudentLine(const std::string& line) {
    const std::optional<StudentLine> parsed = parseStudentLine(line);
    if (!parsed) {
        m_out << "Invalid format. Use: Name YNNY...\n";
        backend::Logger::instance().warning("Rejected malformed line: " + trim(line));
        return;
    }

    try {
        m_roster.add(parsed->name, parsed->attendanceData);
        backend::Logger::instance().info("Added student " + parsed->name + ".");
    } catch (const backend::ValidationError& ex) {
        m_out << "Error: " << ex.what() << "\n";
        backend::Logger::instance().warning("Rejected student " + parsed->name + ": " + ex.what());
    }
}

std::optional<double> ConsoleUI::askAbsenceThreshold() {
    if (m_options.absenceThreshold) {
        return m_options.absenceThreshold;
    }
    while (true) {
        m_out << "Maximum acceptable absence rate (0-100%): " << std::flush;
        std::string line;
        if (!std::getline(m_in, line)) {
            return std::nullopt;
        }
        if (const std::optional<double> value = parsePercentage(line)) {
            return value;
        }
        m_out << "Please enter a number between 0 and 100.\n";
    }
}

std::optional<int> ConsoleUI::askMinStreak() {
    if (m_options.minStreak) {
        return m_options.minStreak;
    }
    while (true) {
        m_out << "Minimum acceptable attendance streak (days): " << std::flush;
        std::string line;
        if (!std::getline(m_in, line)) {
            return std::nullopt;
        }
        if (const std::optional<int> value = parseNonNegativeInt(line)) {
            return value;
        }
        m_out << "Please enter a whole number of days (0 or more).\n";
    }
}

void ConsoleUI::printReport(double absenceThreshold, int minStreak) {
    const ReportRenderer renderer(m_options.useColor);
    try {
        const backend::ReportResult report = m_roster.report(absenceThreshold, minStreak);
        m_out << renderer.render(report);
        backend::Logger::instance().info(
            "Report generated: " + std::to_string(report.defaulterCount) + " of " +
            std::to_string(report.totalStudents) + " student(s) flagged as defaulters.");
    } catch (const backend::EmptyRosterError& ex) {
        m_out << "\n" << renderer.renderEmptyRoster();
        backend::Logger::instance().warning(std::string("Report skipped: ") + ex.what());
    }
}

}  // namespace frontend
