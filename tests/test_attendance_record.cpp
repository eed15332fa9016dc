// File: test_attendance_record.cpp
// Description: Validation and statistics tests for a single student's
//              attendance record. Checks use assert(), so the first failed
//              check aborts the run; the Failed counter only counts
//              unexpected exceptions.

#include "backend/Attendance.hpp"
#include "backend/AttendanceErrors.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace backend;

namespace {

bool nearlyEqual(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

std::string repeat(const std::string& chunk, int times) {
    std::string out;
    for (int i = 0; i < times; ++i) {
        out += chunk;
    }
    return out;
}

}  // namespace

int main() {
    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Perfect attendance... ";
        try {
            const AttendanceRecord record = AttendanceRecord::create("Alice", std::string(30, 'Y'));
            assert(nearlyEqual(record.getAbsenceRate(), 0.0));
            assert(record.getMaxStreak() == 30);
            assert(record.getCurrentStreak() == 30);
            assert(record.getDays().size() == kAttendanceDays);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Absent every day... ";
        try {
            const AttendanceRecord record("Bob", std::string(30, 'N'));
            assert(nearlyEqual(record.getAbsenceRate(), 1.0));
            assert(record.getMaxStreak() == 0);
            assert(record.getCurrentStreak() == 0);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Trailing run is the longest... ";
        try {
            const AttendanceRecord leadingAbsences("Cara", std::string(5, 'N') + std::string(25, 'Y'));
            assert(leadingAbsences.getMaxStreak() == 25);
            assert(leadingAbsences.getCurrentStreak() == 25);

            const AttendanceRecord shortFirstRun("Dan", "YYYNN" + std::string(25, 'Y'));
            assert(shortFirstRun.getMaxStreak() == 25);
            assert(shortFirstRun.getCurrentStreak() == 25);
            assert(nearlyEqual(shortFirstRun.getAbsenceRate(), 2.0 / 30.0));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Current streak resets on a final absence... ";
        try {
            const AttendanceRecord record("Eve", std::string(12, 'Y') + "N" + std::string(16, 'Y') + "N");
            assert(record.getMaxStreak() == 16);
            assert(record.getCurrentStreak() == 0);

            const AttendanceRecord shortTail("Finn", std::string(20, 'Y') + "N" + std::string(9, 'Y'));
            assert(shortTail.getMaxStreak() == 20);
            assert(shortTail.getCurrentStreak() == 9);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Defaulter thresholds are strict... ";
        try {
            // 3 absences out of 30 is exactly a 10% absence rate.
            const AttendanceRecord record("Gina", "NNN" + std::string(27, 'Y'));
            assert(!record.isDefaulter(0.10, 20));
            assert(!record.isDefaulter(0.10, 27));
            assert(record.isDefaulter(0.10, 28));
            assert(record.isDefaulter(0.09, 0));
            assert(!record.isDefaulter(1.0, 0));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Defaulter flag is monotonic in both thresholds... ";
        try {
            const AttendanceRecord record("Hank", repeat("YYYYYN", 5));
            bool wasDefaulter = true;
            for (int step = 0; step <= 100; ++step) {
                const bool defaulter = record.isDefaulter(step / 100.0, 3);
                assert(wasDefaulter || !defaulter);
                wasDefaulter = defaulter;
            }
            bool defaulterAtLowerStreak = false;
            for (int minStreak = 0; minStreak <= 31; ++minStreak) {
                const bool defaulter = record.isDefaulter(1.0, minStreak);
                assert(!defaulterAtLowerStreak || defaulter);
                defaulterAtLowerStreak = defaulter;
            }
            assert(!record.isDefaulter(1.0, 5));
            assert(record.isDefaulter(1.0, 6));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Wrong length is rejected with the accepted count... ";
        try {
            bool thrown = false;
            try {
                (void)AttendanceRecord::create("Ivy", std::string(29, 'Y'));
            } catch (const WrongLengthError& err) {
                thrown = true;
                assert(err.actualCount() == 29);
                assert(std::string(err.what()) == "wrong length");
            }
            assert(thrown);

            thrown = false;
            try {
                (void)AttendanceRecord::create("Ivy", "1001100110011001100110011001" "101");
            } catch (const WrongLengthError& err) {
                thrown = true;
                assert(err.actualCount() == 31);
            }
            assert(thrown);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: Invalid characters are named... ";
        try {
            bool thrown = false;
            try {
                (void)AttendanceRecord::create("Jack", std::string(10, 'Y') + "X" + std::string(19, 'N'));
            } catch (const InvalidCharacterError& err) {
                thrown = true;
                assert(err.character() == 'X');
                assert(std::string(err.what()) == "invalid character: X");
            }
            assert(thrown);

            // Whitespace must be stripped before the record sees it.
            thrown = false;
            try {
                (void)AttendanceRecord::create("Jack", "YYYYY YYYYY");
            } catch (const InvalidCharacterError& err) {
                thrown = true;
                assert(err.character() == ' ');
            }
            assert(thrown);

            // A bad character is reported even if the length is also wrong.
            thrown = false;
            try {
                (void)AttendanceRecord::create("Jack", "YY?");
            } catch (const InvalidCharacterError&) {
                thrown = true;
            }
            assert(thrown);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 9: Empty or blank names are rejected... ";
        try {
            int rejected = 0;
            for (const std::string& name : {std::string(), std::string("   "), std::string("\t\n")}) {
                try {
                    (void)AttendanceRecord::create(name, std::string(30, 'Y'));
                } catch (const EmptyNameError& err) {
                    assert(std::string(err.what()) == "empty name");
                    ++rejected;
                }
            }
            assert(rejected == 3);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 10: Derived values agree with the parsed days... ";
        try {
            const std::vector<std::string> inputs = {
                repeat("1y0n", 7) + "Y1",
                repeat("NNY", 10),
                repeat("yn", 15),
                "0" + std::string(28, '1') + "0",
            };
            for (const std::string& input : inputs) {
                const AttendanceRecord record("Kim", input);
                int absent = 0;
                std::string canonical;
                for (const char ch : input) {
                    const bool present = ch == '1' || ch == 'Y' || ch == 'y';
                    absent += present ? 0 : 1;
                    canonical.push_back(present ? 'Y' : 'N');
                }
                assert(std::lround(record.getAbsenceRate() * 30.0) == absent);
                assert(record.getMaxStreak() >= record.getCurrentStreak());
                assert(record.presenceString() == canonical);
            }
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 11: Summary line layout... ";
        try {
            const AttendanceRecord record("Alice", std::string(30, 'Y'));
            const std::string expected =
                "Alice" + std::string(11, ' ') + std::string(30, 'Y') +
                " | Max: 30 days | Current: 30 days | Absent: 0%";
            assert(record.toString() == expected);

            const AttendanceRecord sparse("Bo", "N" + repeat("YN", 14) + "Y");
            const std::string line = sparse.toString();
            assert(line.rfind("Bo" + std::string(14, ' ') + "NYNY", 0) == 0);
            assert(line.find("| Max:  1 days | Current:  1 days | Absent: 50%") != std::string::npos);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";
    return (failed == 0) ? 0 : 1;
}
