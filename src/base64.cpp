#include "rtbprice/base64.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

namespace rtbprice::base64 {

namespace {

constexpr char kStdTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kUrlTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

using DecodeTable = std::array<std::uint8_t, 256>;

DecodeTable BuildDecodeTable(const char* enc_table) {
    DecodeTable table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(enc_table[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const DecodeTable kStdDecTable = BuildDecodeTable(kStdTable);
const DecodeTable kUrlDecTable = BuildDecodeTable(kUrlTable);

bool IsUrlSafe(Variant variant) {
    return variant == Variant::UrlSafe || variant == Variant::UrlSafeRaw;
}

const char* EncodeTableFor(Variant variant) {
    return IsUrlSafe(variant) ? kUrlTable : kStdTable;
}

const DecodeTable& DecodeTableFor(Variant variant) {
    return IsUrlSafe(variant) ? kUrlDecTable : kStdDecTable;
}

}  // namespace

bool IsPadded(Variant variant) {
    return variant == Variant::Standard || variant == Variant::UrlSafe;
}

std::size_t EncodedLen(std::size_t data_len, Variant variant) {
    if (IsPadded(variant)) {
        return ((data_len + 2) / 3) * 4;
    }
    return (data_len * 8 + 5) / 6;
}

std::string Encode(const std::uint8_t* data, std::size_t len, Variant variant) {
    const char* table = EncodeTableFor(variant);
    const bool padded = IsPadded(variant);
    std::string out;
    out.reserve(EncodedLen(len, variant));
    std::size_t i = 0;
    while (i + 2 < len) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(table[(triple >> 18) & 0x3F]);
        out.push_back(table[(triple >> 12) & 0x3F]);
        out.push_back(table[(triple >> 6) & 0x3F]);
        out.push_back(table[triple & 0x3F]);
        i += 3;
    }
    if (i < len) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(table[(triple >> 18) & 0x3F]);
        if (i + 1 < len) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
            out.push_back(table[(triple >> 12) & 0x3F]);
            out.push_back(table[(triple >> 6) & 0x3F]);
            if (padded) {
                out.push_back('=');
            }
        } else {
            out.push_back(table[(triple >> 12) & 0x3F]);
            if (padded) {
                out.push_back('=');
                out.push_back('=');
            }
        }
    }
    return out;
}

std::string Encode(const std::vector<std::uint8_t>& data, Variant variant) {
    return Encode(data.data(), data.size(), variant);
}

std::vector<std::uint8_t> Decode(const std::string& input, Variant variant, bool* ok, bool strict,
                                 std::size_t* error_offset) {
    const DecodeTable& table = DecodeTableFor(variant);
    const bool padded = IsPadded(variant);
    bool success = true;
    std::size_t bad_at = input.size();
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 4) * 3 + 2);

    std::uint32_t val = 0;
    int valb = 0;
    std::size_t symbols = 0;
    std::size_t padding = 0;
    std::size_t last_symbol_at = 0;
    std::size_t first_pad_at = input.size();
    for (std::size_t pos = 0; pos < input.size(); ++pos) {
        const unsigned char c = static_cast<unsigned char>(input[pos]);
        if (c == '\r' || c == '\n') {
            continue;
        }
        if (c == '=') {
            if (!padded) {
                success = false;
                bad_at = pos;
                break;
            }
            if (padding == 0) {
                first_pad_at = pos;
            }
            ++padding;
            continue;
        }
        if (padding > 0) {
            // Data after padding.
            success = false;
            bad_at = pos;
            break;
        }
        std::uint8_t decoded = table[c];
        if (decoded == 0xFF) {
            success = false;
            bad_at = pos;
            break;
        }
        val = (val << 6) | decoded;
        valb += 6;
        ++symbols;
        last_symbol_at = pos;
        if (valb >= 8) {
            valb -= 8;
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
        }
    }

    if (success) {
        const std::size_t tail = symbols % 4;
        if (tail == 1) {
            success = false;
            bad_at = last_symbol_at;
        } else if (padded) {
            const std::size_t expected_padding = tail == 0 ? 0 : 4 - tail;
            if (padding != expected_padding) {
                success = false;
                // Too much padding points at the first '='; too little at the end.
                bad_at = padding > expected_padding ? first_pad_at : input.size();
            }
        }
    }
    if (success && strict && valb > 0 && (val & ((1u << valb) - 1u)) != 0) {
        success = false;
        bad_at = last_symbol_at;
    }

    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
        if (error_offset) {
            *error_offset = bad_at;
        }
    }
    return out;
}

Variant VariantFromFlag(const std::string& flag) {
    if (flag == "std" || flag == "standard") {
        return Variant::Standard;
    }
    if (flag == "std-raw" || flag == "standard-raw") {
        return Variant::StandardRaw;
    }
    if (flag == "url" || flag == "urlsafe") {
        return Variant::UrlSafe;
    }
    if (flag == "url-raw" || flag == "urlsafe-raw") {
        return Variant::UrlSafeRaw;
    }
    throw std::invalid_argument("Unknown base64 variant: " + flag);
}

std::string VariantFlag(Variant variant) {
    switch (variant) {
        case Variant::Standard:
            return "std";
        case Variant::StandardRaw:
            return "std-raw";
        case Variant::UrlSafe:
            return "url";
        case Variant::UrlSafeRaw:
            return "url-raw";
    }
    return "std";
}

}  // namespace rtbprice::base64
