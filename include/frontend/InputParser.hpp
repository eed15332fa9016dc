// File: InputParser.hpp
// Description: Declares helpers that turn raw console lines into the values
//              handed to the attendance roster.

#pragma once

#include <optional>
#include <string>

namespace frontend {

struct StudentLine {
    std::string name;
    std::string attendanceData;
};

std::string trim(const std::string& input);

// First whitespace-delimited token is the name; the remainder, with every
// whitespace character removed, is the attendance data. Returns nullopt if
// there is no remainder.
std::optional<StudentLine> parseStudentLine(const std::string& line);

bool isDoneCommand(const std::string& line);

// Accepts a percentage in [0, 100] and returns it as a fraction.
std::optional<double> parsePercentage(const std::string& text);

std::optional<int> parseNonNegativeInt(const std::string& text);

}  // namespace frontend
