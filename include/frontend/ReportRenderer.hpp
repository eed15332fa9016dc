// File: ReportRenderer.hpp
// Description: Declares the console formatter for roster defaulter reports.

#pragma once

#include "backend/AttendanceRoster.hpp"

#include <string>

namespace frontend {

class ReportRenderer {
public:
    explicit ReportRenderer(bool useColor);

    std::string render(const backend::ReportResult& report) const;
    std::string renderEmptyRoster() const;

    static std::string formatPercent(double fraction);

private:
    bool m_useColor;

    std::string renderEntry(const backend::ReportEntry& entry) const;
    std::string colored(const char* color, const std::string& text) const;
};

}  // namespace frontend
