#include "rtbprice/keys.hpp"

#include "rtbprice/constants.hpp"
#include "rtbprice/env.hpp"
#include "rtbprice/errors.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace rtbprice::keys {

namespace {

Bytes DecodeKey(KeyRole role, base64::Variant variant, const std::string& text) {
    bool ok = false;
    std::size_t bad_at = 0;
    Bytes key = base64::Decode(text, variant, &ok, false, &bad_at);
    if (!ok) {
        throw KeyDecodeError(role, "illegal " + base64::VariantFlag(variant) + " base64 data at input byte "
                                       + std::to_string(bad_at));
    }
    return key;
}

std::string RequireEnv(KeyRole role, std::string_view name) {
    std::optional<std::string> value = env::Lookup(name);
    if (!value) {
        throw KeyDecodeError(role, std::string(name) + " is not set");
    }
    return *value;
}

}  // namespace

KeyPair ParseKeys(base64::Variant variant, const std::string& integrity_text, const std::string& encryption_text) {
    KeyPair keys;
    keys.integrity = DecodeKey(KeyRole::Integrity, variant, integrity_text);
    keys.encryption = DecodeKey(KeyRole::Encryption, variant, encryption_text);
    return keys;
}

KeyPair LoadKeysFromEnv(std::optional<base64::Variant> variant_override) {
    std::string integrity_text = RequireEnv(KeyRole::Integrity, constants::kEnvIntegrityKey);
    std::string encryption_text = RequireEnv(KeyRole::Encryption, constants::kEnvEncryptionKey);
    base64::Variant variant = variant_override
                                  ? *variant_override
                                  : base64::VariantFromFlag(
                                        env::Get(constants::kEnvKeyEncoding, constants::kDefaultKeyEncoding));
    return ParseKeys(variant, integrity_text, encryption_text);
}

}  // namespace rtbprice::keys
