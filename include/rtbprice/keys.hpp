#pragma once

#include "rtbprice/base64.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rtbprice::keys {

using Bytes = std::vector<std::uint8_t>;

struct KeyPair {
    Bytes integrity;
    Bytes encryption;
};

// Decodes both keys with the given base64 variant. Throws KeyDecodeError
// naming the key that failed.
KeyPair ParseKeys(base64::Variant variant, const std::string& integrity_text, const std::string& encryption_text);

// Reads RTBPRICE_INTEGRITY_KEY and RTBPRICE_ENCRYPTION_KEY. The keys are
// decoded with `variant_override` when given, otherwise with
// RTBPRICE_KEY_ENCODING (default "url").
KeyPair LoadKeysFromEnv(std::optional<base64::Variant> variant_override = std::nullopt);

}  // namespace rtbprice::keys
