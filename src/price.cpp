#include "rtbprice/price.hpp"

#include "rtbprice/base64.hpp"
#include "rtbprice/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

namespace rtbprice::price {

namespace {

using constants::kEncodedLen;
using constants::kIvLen;
using constants::kIvOffset;
using constants::kPadLen;
using constants::kPriceLen;
using constants::kPriceOffset;
using constants::kTagLen;
using constants::kTagOffset;
using constants::kWireLen;

constexpr base64::Variant kWireVariant = base64::Variant::UrlSafeRaw;

static_assert(kPadLen == std::tuple_size<Pad>::value, "pad must be a full HMAC-SHA1 digest");
static_assert(kPadLen >= kPriceLen, "pad must cover every price byte");
static_assert(crypto::kSha1DigestLen >= kTagLen, "tag is a truncated HMAC-SHA1");

void EnsureKeys(const Bytes& integrity_key, const Bytes& encryption_key) {
    if (integrity_key.empty() || encryption_key.empty()) {
        throw PriceError(PriceErrorCode::EmptyKey,
                         integrity_key.empty() ? "integrity key is empty" : "encryption key is empty");
    }
}

std::string EncryptWithIv(const Bytes& integrity_key,
                          const Bytes& encryption_key,
                          const Iv& iv,
                          std::uint64_t price) {
    PriceBytes plain = EncodePriceBytes(price);
    WireBuffer wire;
    wire.iv = iv;
    wire.masked_price = Mask(plain, DerivePad(encryption_key, iv));
    wire.tag = ComputeTag(integrity_key, plain, iv);
    WireBytes raw = wire.Serialize();
    return base64::Encode(raw.data(), raw.size(), kWireVariant);
}

}  // namespace

WireBytes WireBuffer::Serialize() const {
    WireBytes out{};
    std::copy(iv.begin(), iv.end(), out.begin() + kIvOffset);
    std::copy(masked_price.begin(), masked_price.end(), out.begin() + kPriceOffset);
    std::copy(tag.begin(), tag.end(), out.begin() + kTagOffset);
    return out;
}

WireBuffer WireBuffer::Parse(const Bytes& data) {
    if (data.size() != kWireLen) {
        throw PriceError(PriceErrorCode::WrongDecodedLength,
                         "invalid decoded price length, expected " + std::to_string(kWireLen) + " got "
                             + std::to_string(data.size()));
    }
    WireBuffer wire;
    std::copy_n(data.begin() + kIvOffset, kIvLen, wire.iv.begin());
    std::copy_n(data.begin() + kPriceOffset, kPriceLen, wire.masked_price.begin());
    std::copy_n(data.begin() + kTagOffset, kTagLen, wire.tag.begin());
    return wire;
}

PriceBytes EncodePriceBytes(std::uint64_t price) {
    PriceBytes out{};
    for (std::size_t i = 0; i < kPriceLen; ++i) {
        out[kPriceLen - 1 - i] = static_cast<std::uint8_t>((price >> (i * 8)) & 0xFFu);
    }
    return out;
}

std::uint64_t DecodePriceBytes(const PriceBytes& bytes) {
    std::uint64_t value = 0;
    for (std::uint8_t byte : bytes) {
        value = (value << 8) | byte;
    }
    return value;
}

Pad DerivePad(const Bytes& encryption_key, const Iv& iv) {
    return crypto::HmacSha1Digest(encryption_key, iv.data(), iv.size());
}

PriceBytes Mask(const PriceBytes& value, const Pad& pad) {
    PriceBytes out{};
    for (std::size_t i = 0; i < kPriceLen; ++i) {
        out[i] = static_cast<std::uint8_t>(value[i] ^ pad[i]);
    }
    return out;
}

Tag ComputeTag(const Bytes& integrity_key, const PriceBytes& price_bytes, const Iv& iv) {
    crypto::HmacSha1 mac(integrity_key);
    mac.Update(price_bytes.data(), price_bytes.size());
    mac.Update(iv.data(), iv.size());
    crypto::Sha1Digest digest = mac.Final();
    Tag tag{};
    std::copy_n(digest.begin(), kTagLen, tag.begin());
    return tag;
}

bool VerifyTag(const Bytes& integrity_key, const PriceBytes& price_bytes, const Iv& iv, const Tag& expected) {
    Tag actual = ComputeTag(integrity_key, price_bytes, iv);
    return crypto::ConstantTimeEqual(actual.data(), expected.data(), kTagLen);
}

std::string EncryptPrice(const Bytes& integrity_key,
                         const Bytes& encryption_key,
                         const Bytes& iv,
                         std::uint64_t price) {
    EnsureKeys(integrity_key, encryption_key);
    if (iv.size() != kIvLen) {
        throw PriceError(PriceErrorCode::InvalidIvLength,
                         "expected " + std::to_string(kIvLen) + " bytes got " + std::to_string(iv.size()));
    }
    Iv fixed_iv{};
    std::copy(iv.begin(), iv.end(), fixed_iv.begin());
    return EncryptWithIv(integrity_key, encryption_key, fixed_iv, price);
}

std::string EncryptPrice(const keys::KeyPair& keys, const Bytes& iv, std::uint64_t price) {
    return EncryptPrice(keys.integrity, keys.encryption, iv, price);
}

std::string EncryptPriceRandomIv(const keys::KeyPair& keys, std::uint64_t price) {
    EnsureKeys(keys.integrity, keys.encryption);
    Iv iv{};
    crypto::RandomFill(iv.data(), iv.size());
    return EncryptWithIv(keys.integrity, keys.encryption, iv, price);
}

std::uint64_t DecryptPrice(const Bytes& integrity_key, const Bytes& encryption_key, const std::string& encoded) {
    EnsureKeys(integrity_key, encryption_key);
    if (encoded.size() != kEncodedLen) {
        throw PriceError(PriceErrorCode::WrongEncodedLength,
                         "invalid length, expected " + std::to_string(kEncodedLen) + " got "
                             + std::to_string(encoded.size()));
    }

    bool ok = false;
    std::size_t bad_at = 0;
    Bytes decoded = base64::Decode(encoded, kWireVariant, &ok, true, &bad_at);
    if (!ok) {
        throw PriceError(PriceErrorCode::Base64DecodeFailure,
                         "illegal url-raw base64 data at input byte " + std::to_string(bad_at));
    }
    WireBuffer wire = WireBuffer::Parse(decoded);

    PriceBytes plain = Mask(wire.masked_price, DerivePad(encryption_key, wire.iv));
    if (!VerifyTag(integrity_key, plain, wire.iv, wire.tag)) {
        throw PriceError(PriceErrorCode::IntegrityFailure, "recomputed tag does not match the price signature");
    }
    return DecodePriceBytes(plain);
}

std::uint64_t DecryptPrice(const keys::KeyPair& keys, const std::string& encoded) {
    return DecryptPrice(keys.integrity, keys.encryption, encoded);
}

}  // namespace rtbprice::price
