// File: AttendanceRoster.cpp
// Description: Implements roster insertion and the report pass that sorts,
//              classifies and aggregates the cohort.

#include "backend/AttendanceRoster.hpp"
#include "backend/AttendanceErrors.hpp"

#include <algorithm>

namespace backend {

void AttendanceRoster::add(const std::string& name, const std::string& rawData) {
    m_records.push_back(AttendanceRecord::create(name, rawData));
}

ReportResult AttendanceRoster::report(double absenceThreshold, int minStreak) const {
    if (m_records.empty()) {
        throw EmptyRosterError();
    }

    std::vector<const AttendanceRecord*> sorted;
    sorted.reserve(m_records.size());
    for (const AttendanceRecord& record : m_records) {
        sorted.push_back(&record);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const AttendanceRecord* a, const AttendanceRecord* b) {
                         return a->getName() < b->getName();
                     });

    ReportResult result;
    result.absenceThreshold = absenceThreshold;
    result.minStreak = minStreak;
    result.totalStudents = sorted.size();
    result.entries.reserve(sorted.size());

    double absenceSum = 0.0;
    double maxStreakSum = 0.0;
    for (const AttendanceRecord* record : sorted) {
        const bool defaulter = record->isDefaulter(absenceThreshold, minStreak);
        if (defaulter) {
            ++result.defaulterCount;
        }
        absenceSum += record->getAbsenceRate();
        maxStreakSum += record->getMaxStreak();
        result.entries.push_back(ReportEntry{*record, defaulter});
    }

    const double total = static_cast<double>(result.totalStudents);
    result.defaulterPercentage = static_cast<double>(result.defaulterCount) / total;
    result.overallAbsenceRate = absenceSum / total;
    result.avgMaxStreak = maxStreakSum / total;
    return result;
}

const std::vector<AttendanceRecord>& AttendanceRoster::records() const noexcept {
    return m_records;
}

std::size_t AttendanceRoster::size() const noexcept {
    return m_records.size();
}

bool AttendanceRoster::empty() const noexcept {
    return m_records.empty();
}

}  // namespace backend
