// File: AttendanceRoster.hpp
// Description: Declares the class roster and the defaulter report computed
//              from it.

#pragma once

#include "backend/Attendance.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace backend {

struct ReportEntry {
    AttendanceRecord record;
    bool isDefaulter{false};
};

struct ReportResult {
    std::vector<ReportEntry> entries;  // sorted by name, stable
    std::size_t totalStudents{0};
    std::size_t defaulterCount{0};
    double defaulterPercentage{0.0};  // fraction of totalStudents
    double overallAbsenceRate{0.0};
    double avgMaxStreak{0.0};
    double absenceThreshold{0.0};
    int minStreak{0};
};

// Not synchronized; a roster belongs to a single session.
class AttendanceRoster {
public:
    void add(const std::string& name, const std::string& rawData);

    ReportResult report(double absenceThreshold, int minStreak) const;

    const std::vector<AttendanceRecord>& records() const noexcept;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

private:
    std::vector<AttendanceRecord> m_records;
};

}  // namespace backend
