#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace rtbprice::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BOLD_RED = "\033[1;31m";
}

// Colors are on when the stream is a TTY and NO_COLOR is unset
bool ColorsEnabled(std::ostream& os = std::cout);

// Set whether colors are enabled (can be disabled via --no-color)
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Cyan(const std::string& text) { return Colorize(text, color::CYAN); }

// Diagnostics on stderr
void PrintError(const std::string& message);
void PrintDebug(const std::string& message);

}  // namespace rtbprice::cli
