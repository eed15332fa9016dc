// File: AttendanceErrors.cpp
// Description: Implements the attendance validation and report exceptions.

#include "backend/AttendanceErrors.hpp"

namespace backend {

ValidationError::ValidationError(const std::string& message)
    : std::invalid_argument(message) {}

EmptyNameError::EmptyNameError() : ValidationError("empty name") {}

InvalidCharacterError::InvalidCharacterError(char character)
    : ValidationError(std::string("invalid character: ") + character),
      m_character(character) {}

char InvalidCharacterError::character() const noexcept {
    return m_character;
}

WrongLengthError::WrongLengthError(std::size_t actualCount)
    : ValidationError("wrong length"), m_actualCount(actualCount) {}

std::size_t WrongLengthError::actualCount() const noexcept {
    return m_actualCount;
}

EmptyRosterError::EmptyRosterError()
    : std::logic_error("cannot build a report for an empty roster") {}

}  // namespace backend
