// File: AttendanceErrors.hpp
// Description: Declares the exception types raised while validating attendance
//              records and while building roster reports.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace backend {

// Base for every rejection of a single attendance record.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message);
};

class EmptyNameError : public ValidationError {
public:
    EmptyNameError();
};

class InvalidCharacterError : public ValidationError {
public:
    explicit InvalidCharacterError(char character);

    char character() const noexcept;

private:
    char m_character;
};

class WrongLengthError : public ValidationError {
public:
    explicit WrongLengthError(std::size_t actualCount);

    std::size_t actualCount() const noexcept;

private:
    std::size_t m_actualCount;
};

// Raised when a report is requested before any student was added.
class EmptyRosterError : public std::logic_error {
public:
    EmptyRosterError();
};

}  // namespace backend
