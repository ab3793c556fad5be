#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rtbprice::env {

// Unset and empty variables both read as std::nullopt.
std::optional<std::string> Lookup(std::string_view name);
std::string Get(std::string_view name, std::string_view fallback = {});
bool IsEnabled(std::string_view name, bool default_value = false);

}  // namespace rtbprice::env
