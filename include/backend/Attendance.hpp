// File: Attendance.hpp
// Description: Declares the attendance record model: one student's validated
//              30-day presence window together with its derived statistics.

#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace backend {

enum class Presence { Present, Absent };

constexpr std::size_t kAttendanceDays = 30;

class AttendanceRecord {
public:
    using Days = std::array<Presence, kAttendanceDays>;

    // Validates the name and the raw day characters ('1'/'Y'/'y' present,
    // '0'/'N'/'n' absent). Throws a ValidationError subclass on rejection.
    AttendanceRecord(std::string name, const std::string& rawData);

    static AttendanceRecord create(const std::string& name, const std::string& rawData);

    const std::string& getName() const noexcept;
    const Days& getDays() const noexcept;
    double getAbsenceRate() const noexcept;
    int getMaxStreak() const noexcept;
    int getCurrentStreak() const noexcept;

    // Either condition alone is enough; both comparisons are strict.
    bool isDefaulter(double absenceThreshold, int minStreak) const noexcept;

    std::string presenceString() const;
    std::string toString() const;

private:
    std::string m_name;
    Days m_days{};
    double m_absenceRate{0.0};
    int m_maxStreak{0};
    int m_currentStreak{0};

    void computeStatistics() noexcept;
};

}  // namespace backend
