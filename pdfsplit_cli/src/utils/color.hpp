#ifndef PDFSPLIT_COLOR_HPP
#define PDFSPLIT_COLOR_HPP

// ANSI escape sequences for console output
inline constexpr const char* RESET  = "\033[0m";
inline constexpr const char* RED    = "\033[31m";
inline constexpr const char* GREEN  = "\033[32m";
inline constexpr const char* YELLOW = "\033[33m";

#endif // PDFSPLIT_COLOR_HPP
