#include "rtbprice/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace rtbprice::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::optional<std::string> Lookup(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string Get(std::string_view name, std::string_view fallback) {
    std::optional<std::string> value = Lookup(name);
    if (!value) {
        return std::string(fallback);
    }
    return *value;
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::optional<std::string> value = Lookup(name);
    if (!value) {
        return default_value;
    }
    std::string normalized = ToLower(*value);
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

}  // namespace rtbprice::env
