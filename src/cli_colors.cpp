#include "rtbprice/cli_colors.hpp"

#include "rtbprice/constants.hpp"
#include "rtbprice/env.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace rtbprice::cli {

namespace {
    bool g_colors_enabled = true;
    bool g_colors_forced = false;

    bool IsTty(std::ostream& os) {
        if (&os == &std::cout) {
            return isatty(fileno(stdout)) != 0;
        }
        if (&os == &std::cerr || &os == &std::clog) {
            return isatty(fileno(stderr)) != 0;
        }
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_colors_forced) {
        return g_colors_enabled;
    }
    if (env::Lookup(constants::kEnvNoColor)) {
        return false;
    }
    return IsTty(os);
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled = enabled;
    g_colors_forced = true;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

void PrintError(const std::string& message) {
    std::cerr << Colorize("Error:", color::BOLD_RED, std::cerr) << " " << message << "\n";
}

void PrintDebug(const std::string& message) {
    std::cerr << Colorize("DEBUG:", color::CYAN, std::cerr) << " " << message << "\n";
}

}  // namespace rtbprice::cli
