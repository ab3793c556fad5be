#pragma once

#include <cstddef>
#include <string_view>

namespace rtbprice::constants {

inline constexpr std::size_t kIvLen = 16;
inline constexpr std::size_t kPriceLen = 8;
inline constexpr std::size_t kTagLen = 4;
inline constexpr std::size_t kWireLen = kIvLen + kPriceLen + kTagLen;
inline constexpr std::size_t kEncodedLen = 38;

// HMAC-SHA1 output; only the first kPriceLen bytes feed the mask.
inline constexpr std::size_t kPadLen = 20;

inline constexpr std::size_t kIvOffset = 0;
inline constexpr std::size_t kPriceOffset = kIvOffset + kIvLen;
inline constexpr std::size_t kTagOffset = kPriceOffset + kPriceLen;

static_assert(kWireLen == 28, "wire buffer must stay 28 bytes");
static_assert((kWireLen * 8 + 5) / 6 == kEncodedLen, "encoded length must match unpadded base64 of the wire buffer");

inline constexpr std::string_view kEnvIntegrityKey = "RTBPRICE_INTEGRITY_KEY";
inline constexpr std::string_view kEnvEncryptionKey = "RTBPRICE_ENCRYPTION_KEY";
inline constexpr std::string_view kEnvKeyEncoding = "RTBPRICE_KEY_ENCODING";
inline constexpr std::string_view kEnvVerbose = "RTBPRICE_VERBOSE";
inline constexpr std::string_view kEnvNoColor = "NO_COLOR";

inline constexpr std::string_view kDefaultKeyEncoding = "url";
inline constexpr std::string_view kVersion = "1.0.0";

}  // namespace rtbprice::constants
