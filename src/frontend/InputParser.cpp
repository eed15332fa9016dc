// File: InputParser.cpp
// Description: Implements console line splitting and threshold parsing.

#include "frontend/InputParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace frontend {

namespace {

bool isSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string trim(const std::string& input) {
    std::size_t start = 0;
    while (start < input.size() && isSpace(input[start])) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && isSpace(input[end - 1])) {
        --end;
    }
    return input.substr(start, end - start);
}

std::optional<StudentLine> parseStudentLine(const std::string& line) {
    const std::string trimmed = trim(line);
    const auto nameEnd = std::find_if(trimmed.begin(), trimmed.end(), isSpace);
    if (nameEnd == trimmed.end()) {
        return std::nullopt;
    }

    StudentLine parsed;
    parsed.name.assign(trimmed.begin(), nameEnd);
    std::copy_if(nameEnd, trimmed.end(), std::back_inserter(parsed.attendanceData),
                 [](char ch) { return !isSpace(ch); });
    return parsed;
}

bool isDoneCommand(const std::string& line) {
    return toLowerCopy(trim(line)) == "done";
}

std::optional<double> parsePercentage(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    std::size_t consumed = 0;
    try {
        value = std::stod(trimmed, &consumed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    if (consumed != trimmed.size() || !std::isfinite(value) || value < 0.0 || value > 100.0) {
        return std::nullopt;
    }
    return value / 100.0;
}

std::optional<int> parseNonNegativeInt(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.empty() ||
        !std::all_of(trimmed.begin(), trimmed.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }

    try {
        return std::stoi(trimmed);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace frontend
