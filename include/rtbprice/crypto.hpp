#pragma once

#include "rtbprice/crypto_utils.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace rtbprice::crypto {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t kSha1DigestLen = 20;
using Sha1Digest = std::array<std::uint8_t, kSha1DigestLen>;

Bytes RandomBytes(std::size_t size);
void RandomFill(std::uint8_t* out, std::size_t size);

// Incremental HMAC-SHA1 over one or more fragments. Not copyable; each
// instance owns its OpenSSL context.
class HmacSha1 {
public:
    explicit HmacSha1(const Bytes& key);

    HmacSha1(const HmacSha1&) = delete;
    HmacSha1& operator=(const HmacSha1&) = delete;

    void Update(const std::uint8_t* data, std::size_t len);
    Sha1Digest Final();

private:
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    detail::UniqueMac mac_;
    detail::UniqueMacCtx ctx_;
#else
    detail::UniqueHmacCtx ctx_;
#endif
};

Sha1Digest HmacSha1Digest(const Bytes& key, const std::uint8_t* data, std::size_t len);

bool ConstantTimeEqual(const std::uint8_t* a, const std::uint8_t* b, std::size_t len);

}  // namespace rtbprice::crypto
