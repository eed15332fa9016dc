// File: ConsoleUI.hpp
// Description: Declares the console session that collects attendance lines,
//              asks for the defaulter criteria and prints the report.

#pragma once

#include "backend/AttendanceRoster.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace frontend {

struct ConsoleOptions {
    bool useColor{false};
    // Preset criteria skip the matching prompt.
    std::optional<double> absenceThreshold;
    std::optional<int> minStreak;
};

class ConsoleUI {
public:
    ConsoleUI(std::istream& in, std::ostream& out, ConsoleOptions options = {});

    // Returns the process exit code.
    int run();

    const backend::AttendanceRoster& roster() const noexcept;

private:
    std::istream& m_in;
    std::ostream& m_out;
    ConsoleOptions m_options;
    backend::AttendanceRoster m_roster;

    void collectStudents();
    void handleStudentLine(const std::string& line);
    std::optional<double> askAbsenceThreshold();
    std::optional<int> askMinStreak();
    void printReport(double absenceThreshold, int minStreak);
};

}  // namespace frontend
