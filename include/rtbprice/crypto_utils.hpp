#pragma once

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <memory>

namespace rtbprice::crypto::detail {

// RAII wrappers for OpenSSL MAC resources
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
struct EVPMACDeleter {
    void operator()(EVP_MAC* mac) const noexcept {
        if (mac) EVP_MAC_free(mac);
    }
};

struct EVPMACCtxDeleter {
    void operator()(EVP_MAC_CTX* ctx) const noexcept {
        if (ctx) EVP_MAC_CTX_free(ctx);
    }
};

using UniqueMac = std::unique_ptr<EVP_MAC, EVPMACDeleter>;
using UniqueMacCtx = std::unique_ptr<EVP_MAC_CTX, EVPMACCtxDeleter>;
#else
struct HMACCtxDeleter {
    void operator()(HMAC_CTX* ctx) const noexcept {
        if (ctx) HMAC_CTX_free(ctx);
    }
};

using UniqueHmacCtx = std::unique_ptr<HMAC_CTX, HMACCtxDeleter>;
#endif

}  // namespace rtbprice::crypto::detail
