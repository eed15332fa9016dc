// File: ReportRenderer.cpp
// Description: Formats a roster report into the console text layout, with
//              defaulters highlighted when coloring is enabled.

#include "frontend/ReportRenderer.hpp"

#include "frontend/Ansi.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace frontend {

namespace {

constexpr std::size_t kRuleWidth = 80;

}  // namespace

ReportRenderer::ReportRenderer(bool useColor) : m_useColor(useColor) {}

std::string ReportRenderer::formatPercent(double fraction) {
    return std::to_string(std::lround(fraction * 100.0)) + "%";
}

std::string ReportRenderer::render(const backend::ReportResult& report) const {
    std::ostringstream oss;
    oss << "\n" << colored(ansi::bold, "Attendance Analysis Results") << "\n";
    oss << std::string(kRuleWidth, '=') << "\n";
    oss << "Legend: Y = Present, N = Absent\n";
    oss << "Criteria: absence rate > " << std::setprecision(6) << report.absenceThreshold * 100.0
        << "% or max streak < " << report.minStreak << " days\n";
    oss << std::string(kRuleWidth, '-') << "\n";

    for (const backend::ReportEntry& entry : report.entries) {
        oss << renderEntry(entry) << "\n";
    }

    oss << std::string(kRuleWidth, '-') << "\n";
    oss << "Total Students: " << report.totalStudents << "\n";
    oss << "Defaulters: " << report.defaulterCount << " ("
        << formatPercent(report.defaulterPercentage) << ")\n";
    oss << "\nOverall Absence Rate: " << formatPercent(report.overallAbsenceRate) << "\n";
    oss << "Average Maximum Streak: " << std::fixed << std::setprecision(1)
        << report.avgMaxStreak << " days\n";
    return oss.str();
}

std::string ReportRenderer::renderEmptyRoster() const {
    return colored(ansi::muted, "No students were entered; there is nothing to analyze.") + "\n";
}

std::string ReportRenderer::renderEntry(const backend::ReportEntry& entry) const {
    std::string line = entry.record.toString();
    if (entry.isDefaulter) {
        line += " [DEFAULTER]";
        return colored(ansi::defaulter, line);
    }
    return colored(ansi::regular, line);
}

std::string ReportRenderer::colored(const char* color, const std::string& text) const {
    if (!m_useColor) {
        return text;
    }
    return std::string(color) + text + ansi::reset;
}

}  // namespace frontend
