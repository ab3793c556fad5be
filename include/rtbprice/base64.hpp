#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rtbprice::base64 {

enum class Variant {
    Standard,
    StandardRaw,
    UrlSafe,
    UrlSafeRaw
};

std::string Encode(const std::vector<std::uint8_t>& data, Variant variant = Variant::Standard);
std::string Encode(const std::uint8_t* data, std::size_t len, Variant variant);

// Decodes `input` in the given variant. Carriage returns and newlines are
// skipped. Padded variants require canonical '=' padding, raw variants reject
// it. With `strict`, non-zero trailing bits in the last quantum are an error.
// On failure the result is empty, `*ok` (when given) is false and
// `*error_offset` (when given) is the index of the offending input byte, or
// the input length when the input ends early.
std::vector<std::uint8_t> Decode(const std::string& input,
                                 Variant variant = Variant::Standard,
                                 bool* ok = nullptr,
                                 bool strict = false,
                                 std::size_t* error_offset = nullptr);

std::size_t EncodedLen(std::size_t data_len, Variant variant);
bool IsPadded(Variant variant);

Variant VariantFromFlag(const std::string& flag);
std::string VariantFlag(Variant variant);

}  // namespace rtbprice::base64
