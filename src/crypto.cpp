#include "rtbprice/crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
#include <openssl/core_names.h>
#include <openssl/params.h>
#endif

#include <limits>
#include <stdexcept>

namespace rtbprice::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

}  // namespace

void RandomFill(std::uint8_t* out, std::size_t size) {
    if (size == 0) {
        return;
    }
    Ensure(size <= static_cast<std::size_t>(std::numeric_limits<int>::max()), "RAND_bytes request too large");
    Ensure(RAND_bytes(out, static_cast<int>(size)) == 1, "RAND_bytes failed");
}

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    RandomFill(out.data(), out.size());
    return out;
}

HmacSha1::HmacSha1(const Bytes& key) {
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    mac_.reset(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
    Ensure(mac_ != nullptr, "HMAC fetch failed");
    ctx_.reset(EVP_MAC_CTX_new(mac_.get()));
    Ensure(ctx_ != nullptr, "HMAC context allocation failed");
    char digest_name[] = "SHA1";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0),
        OSSL_PARAM_construct_end()
    };
    Ensure(EVP_MAC_init(ctx_.get(), key.data(), key.size(), params) == 1, "HMAC-SHA1 init failed");
#else
    ctx_.reset(HMAC_CTX_new());
    Ensure(ctx_ != nullptr, "HMAC context allocation failed");
    Ensure(HMAC_Init_ex(ctx_.get(), key.data(), static_cast<int>(key.size()), EVP_sha1(), nullptr) == 1,
           "HMAC-SHA1 init failed");
#endif
}

void HmacSha1::Update(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    Ensure(EVP_MAC_update(ctx_.get(), data, len) == 1, "HMAC-SHA1 update failed");
#else
    Ensure(HMAC_Update(ctx_.get(), data, len) == 1, "HMAC-SHA1 update failed");
#endif
}

Sha1Digest HmacSha1::Final() {
    Sha1Digest out{};
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    std::size_t out_len = 0;
    Ensure(EVP_MAC_final(ctx_.get(), out.data(), &out_len, out.size()) == 1, "HMAC-SHA1 final failed");
#else
    unsigned int out_len = 0;
    Ensure(HMAC_Final(ctx_.get(), out.data(), &out_len) == 1, "HMAC-SHA1 final failed");
#endif
    Ensure(out_len == out.size(), "HMAC-SHA1 produced an unexpected digest size");
    return out;
}

Sha1Digest HmacSha1Digest(const Bytes& key, const std::uint8_t* data, std::size_t len) {
    HmacSha1 mac(key);
    mac.Update(data, len);
    return mac.Final();
}

bool ConstantTimeEqual(const std::uint8_t* a, const std::uint8_t* b, std::size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

}  // namespace rtbprice::crypto
