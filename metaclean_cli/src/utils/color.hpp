#ifndef METACLEAN_COLOR_HPP
#define METACLEAN_COLOR_HPP

// ANSI escape sequences for console output
inline constexpr auto RESET  = "\033[0m";
inline constexpr auto RED    = "\033[31m";
inline constexpr auto GREEN  = "\033[32m";
inline constexpr auto YELLOW = "\033[33m";
inline constexpr auto CYAN   = "\033[36m";

#endif // METACLEAN_COLOR_HPP
