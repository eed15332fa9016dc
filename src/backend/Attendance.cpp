// File: Attendance.cpp
// Description: Implements attendance parsing, validation and the per-student
//              statistics (absence rate, longest and trailing present streak).

#include "backend/Attendance.hpp"
#include "backend/AttendanceErrors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace backend {

namespace {

constexpr int kNameColumnWidth = 15;

bool isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
}

bool presenceFromChar(char ch, Presence& presence) {
    switch (ch) {
        case '1':
        case 'Y':
        case 'y':
            presence = Presence::Present;
            return true;
        case '0':
        case 'N':
        case 'n':
            presence = Presence::Absent;
            return true;
        default:
            return false;
    }
}

}  // namespace

AttendanceRecord::AttendanceRecord(std::string name, const std::string& rawData)
    : m_name(std::move(name)) {
    if (isBlank(m_name)) {
        throw EmptyNameError();
    }

    std::size_t accepted = 0;
    for (const char ch : rawData) {
        Presence presence = Presence::Absent;
        if (!presenceFromChar(ch, presence)) {
            throw InvalidCharacterError(ch);
        }
        if (accepted < m_days.size()) {
            m_days[accepted] = presence;
        }
        ++accepted;
    }

    if (accepted != kAttendanceDays) {
        throw WrongLengthError(accepted);
    }

    computeStatistics();
}

AttendanceRecord AttendanceRecord::create(const std::string& name, const std::string& rawData) {
    return AttendanceRecord(name, rawData);
}

const std::string& AttendanceRecord::getName() const noexcept {
    return m_name;
}

const AttendanceRecord::Days& AttendanceRecord::getDays() const noexcept {
    return m_days;
}

double AttendanceRecord::getAbsenceRate() const noexcept {
    return m_absenceRate;
}

int AttendanceRecord::getMaxStreak() const noexcept {
    return m_maxStreak;
}

int AttendanceRecord::getCurrentStreak() const noexcept {
    return m_currentStreak;
}

bool AttendanceRecord::isDefaulter(double absenceThreshold, int minStreak) const noexcept {
    return m_absenceRate > absenceThreshold || m_maxStreak < minStreak;
}

std::string AttendanceRecord::presenceString() const {
    std::string out;
    out.reserve(m_days.size());
    for (const Presence presence : m_days) {
        out.push_back(presence == Presence::Present ? 'Y' : 'N');
    }
    return out;
}

std::string AttendanceRecord::toString() const {
    std::ostringstream oss;
    oss << std::left << std::setw(kNameColumnWidth) << m_name << std::right << ' '
        << presenceString() << " | "
        << "Max: " << std::setw(2) << m_maxStreak << " days | "
        << "Current: " << std::setw(2) << m_currentStreak << " days | "
        << "Absent: " << std::lround(m_absenceRate * 100.0) << '%';
    return oss.str();
}

void AttendanceRecord::computeStatistics() noexcept {
    int absentDays = 0;
    int run = 0;
    m_maxStreak = 0;

    for (const Presence presence : m_days) {
        if (presence == Presence::Present) {
            ++run;
            m_maxStreak = std::max(m_maxStreak, run);
        } else {
            ++absentDays;
            run = 0;
        }
    }

    m_currentStreak = run;
    m_absenceRate = static_cast<double>(absentDays) / static_cast<double>(m_days.size());
}

}  // namespace backend
