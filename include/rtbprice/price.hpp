#pragma once

#include "rtbprice/constants.hpp"
#include "rtbprice/crypto.hpp"
#include "rtbprice/keys.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace rtbprice::price {

using Bytes = std::vector<std::uint8_t>;
using Iv = std::array<std::uint8_t, constants::kIvLen>;
using PriceBytes = std::array<std::uint8_t, constants::kPriceLen>;
using Pad = crypto::Sha1Digest;
using Tag = std::array<std::uint8_t, constants::kTagLen>;
using WireBytes = std::array<std::uint8_t, constants::kWireLen>;

// {iv (16 bytes)}{masked price (8 bytes)}{tag (4 bytes)}
struct WireBuffer {
    Iv iv{};
    PriceBytes masked_price{};
    Tag tag{};

    WireBytes Serialize() const;
    // Throws PriceError(WrongDecodedLength) unless `data` is exactly 28 bytes.
    static WireBuffer Parse(const Bytes& data);
};

PriceBytes EncodePriceBytes(std::uint64_t price);
std::uint64_t DecodePriceBytes(const PriceBytes& bytes);

// HMAC-SHA1(encryption_key, iv). Only the first 8 bytes are used as the mask.
Pad DerivePad(const Bytes& encryption_key, const Iv& iv);

// XOR with the first 8 pad bytes; applying it twice restores the input.
PriceBytes Mask(const PriceBytes& value, const Pad& pad);

// First 4 bytes of HMAC-SHA1(integrity_key, price_bytes || iv).
Tag ComputeTag(const Bytes& integrity_key, const PriceBytes& price_bytes, const Iv& iv);
bool VerifyTag(const Bytes& integrity_key, const PriceBytes& price_bytes, const Iv& iv, const Tag& expected);

// Returns the 38 character URL-safe unpadded base64 price.
// Throws PriceError(EmptyKey | InvalidIvLength).
std::string EncryptPrice(const Bytes& integrity_key,
                         const Bytes& encryption_key,
                         const Bytes& iv,
                         std::uint64_t price);
std::string EncryptPrice(const keys::KeyPair& keys, const Bytes& iv, std::uint64_t price);
std::string EncryptPriceRandomIv(const keys::KeyPair& keys, std::uint64_t price);

// Throws PriceError(EmptyKey | WrongEncodedLength | Base64DecodeFailure |
// WrongDecodedLength | IntegrityFailure).
std::uint64_t DecryptPrice(const Bytes& integrity_key, const Bytes& encryption_key, const std::string& encoded);
std::uint64_t DecryptPrice(const keys::KeyPair& keys, const std::string& encoded);

}  // namespace rtbprice::price
