// File: Ansi.hpp
// Description: ANSI escape sequences used to highlight report lines on
//              terminals that support them.

#pragma once

#if defined(_WIN32)
#include <windows.h>
#endif

namespace frontend::ansi {

inline constexpr const char* reset = "\x1b[0m";
inline constexpr const char* bold = "\x1b[1m";
inline constexpr const char* defaulter = "\x1b[31m";
inline constexpr const char* regular = "\x1b[37m";
inline constexpr const char* muted = "\x1b[90m";

inline void enableVirtualTerminalOnWindows() {
#if defined(_WIN32)
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE) {
        return;
    }
    DWORD mode = 0;
    if (!GetConsoleMode(hOut, &mode)) {
        return;
    }
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    SetConsoleMode(hOut, mode);
#endif
}

}  // namespace frontend::ansi
