#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "rtbprice/base64.hpp"

namespace {

using rtbprice::base64::Decode;
using rtbprice::base64::Encode;
using rtbprice::base64::Variant;

int g_failures = 0;

void Check(bool cond, const std::string& label) {
    std::cout << "  " << label << ": " << (cond ? "ok" : "FAILED") << std::endl;
    if (!cond) {
        ++g_failures;
    }
}

std::vector<std::uint8_t> Bytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

bool Rejects(const std::string& input, Variant variant, bool strict = false) {
    bool ok = true;
    std::vector<std::uint8_t> out = Decode(input, variant, &ok, strict);
    return !ok && out.empty();
}

bool DecodesTo(const std::string& input, Variant variant, const std::string& expected, bool strict = false) {
    bool ok = false;
    std::vector<std::uint8_t> out = Decode(input, variant, &ok, strict);
    return ok && out == Bytes(expected);
}

std::size_t FailsAt(const std::string& input, Variant variant, bool strict = false) {
    bool ok = true;
    std::size_t offset = input.size() + 100;
    Decode(input, variant, &ok, strict, &offset);
    return ok ? input.size() + 100 : offset;
}

void TestEncode() {
    std::cout << "Encode:" << std::endl;
    Check(Encode(Bytes("")) == "", "empty");
    Check(Encode(Bytes("f")) == "Zg==", "f");
    Check(Encode(Bytes("fo")) == "Zm8=", "fo");
    Check(Encode(Bytes("foo")) == "Zm9v", "foo");
    Check(Encode(Bytes("foobar")) == "Zm9vYmFy", "foobar");
    Check(Encode(Bytes("f"), Variant::StandardRaw) == "Zg", "f unpadded");
    Check(Encode(Bytes("fo"), Variant::UrlSafeRaw) == "Zm8", "fo unpadded");

    const std::vector<std::uint8_t> high = {0xFB, 0xFF};
    Check(Encode(high, Variant::Standard) == "+/8=", "standard alphabet");
    Check(Encode(high, Variant::UrlSafe) == "-_8=", "url-safe alphabet");
    Check(Encode(high, Variant::UrlSafeRaw) == "-_8", "url-safe unpadded");

    Check(rtbprice::base64::EncodedLen(28, Variant::UrlSafeRaw) == 38, "28 bytes unpadded is 38 chars");
    Check(rtbprice::base64::EncodedLen(32, Variant::UrlSafe) == 44, "32 bytes padded is 44 chars");
}

void TestDecode() {
    std::cout << "Decode:" << std::endl;
    Check(DecodesTo("", Variant::Standard, ""), "empty");
    Check(DecodesTo("Zg==", Variant::Standard, "f"), "padded f");
    Check(DecodesTo("Zm8=", Variant::UrlSafe, "fo"), "padded fo");
    Check(DecodesTo("Zm9vYmFy", Variant::Standard, "foobar"), "foobar");
    Check(DecodesTo("Zg", Variant::StandardRaw, "f"), "unpadded f");
    Check(DecodesTo("Zm9v\r\nYmFy", Variant::Standard, "foobar"), "line breaks are skipped");

    Check(Rejects("Zg", Variant::Standard), "padded variant needs padding");
    Check(Rejects("Zg=", Variant::Standard), "short padding");
    Check(Rejects("Zm9v=", Variant::Standard), "padding after a full quantum");
    Check(Rejects("Zg==Zg==", Variant::Standard), "data after padding");
    Check(Rejects("Zg==", Variant::StandardRaw), "raw variant rejects padding");
    Check(Rejects("Z", Variant::StandardRaw), "single trailing symbol");
    Check(Rejects("Zm9*", Variant::Standard), "symbol outside the alphabet");
    Check(Rejects("-_8=", Variant::Standard), "url symbols in standard variant");
    Check(Rejects("+/8=", Variant::UrlSafe), "standard symbols in url variant");
    Check(Rejects("Zm9v YmFy", Variant::Standard), "spaces are not skipped");

    Check(DecodesTo("Zh", Variant::StandardRaw, "f"), "lenient about trailing bits");
    Check(Rejects("Zh", Variant::StandardRaw, true), "strict about trailing bits");
    Check(DecodesTo("Zg", Variant::StandardRaw, "f", true), "strict accepts canonical input");

    std::vector<std::uint8_t> all(256);
    for (std::size_t i = 0; i < all.size(); ++i) {
        all[i] = static_cast<std::uint8_t>(i);
    }
    for (Variant variant : {Variant::Standard, Variant::StandardRaw, Variant::UrlSafe, Variant::UrlSafeRaw}) {
        bool ok = false;
        std::vector<std::uint8_t> back = Decode(Encode(all, variant), variant, &ok, true);
        Check(ok && back == all, "every byte value survives " + rtbprice::base64::VariantFlag(variant));
    }
}

void TestErrorOffsets() {
    std::cout << "Error offsets:" << std::endl;
    Check(FailsAt("Zm9*", Variant::Standard) == 3, "symbol outside the alphabet");
    Check(FailsAt("Zm9v YmFy", Variant::Standard) == 4, "space");
    Check(FailsAt("Zg==Zg==", Variant::Standard) == 4, "data after padding");
    Check(FailsAt("Zg==", Variant::StandardRaw) == 2, "padding in a raw variant");
    Check(FailsAt("Zm9v=", Variant::Standard) == 4, "excess padding");
    Check(FailsAt("Zg=", Variant::Standard) == 3, "short padding points at the end");
    Check(FailsAt("Zm9vZ", Variant::StandardRaw) == 4, "dangling symbol");
    Check(FailsAt("Zh", Variant::StandardRaw, true) == 1, "non-zero trailing bits");
    Check(FailsAt("Zm\r\n9*", Variant::Standard) == 5, "offset counts skipped line breaks");
}

void TestVariantFlags() {
    std::cout << "Variant flags:" << std::endl;
    Check(rtbprice::base64::VariantFromFlag("url") == Variant::UrlSafe, "url");
    Check(rtbprice::base64::VariantFromFlag("url-raw") == Variant::UrlSafeRaw, "url-raw");
    Check(rtbprice::base64::VariantFromFlag("std") == Variant::Standard, "std");
    Check(rtbprice::base64::VariantFromFlag("std-raw") == Variant::StandardRaw, "std-raw");
    Check(rtbprice::base64::VariantFlag(Variant::UrlSafeRaw) == "url-raw", "flag for url-raw");
    Check(!rtbprice::base64::IsPadded(Variant::UrlSafeRaw) && rtbprice::base64::IsPadded(Variant::UrlSafe),
          "padding per variant");
    bool rejected = false;
    try {
        rtbprice::base64::VariantFromFlag("base32");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    Check(rejected, "unknown flag is rejected");
}

}  // namespace

int main() {
    TestEncode();
    TestDecode();
    TestErrorOffsets();
    TestVariantFlags();

    std::cout << "\n" << (g_failures == 0 ? "All base64 checks passed" : "Base64 checks FAILED: " + std::to_string(g_failures))
              << std::endl;
    return g_failures == 0 ? 0 : 1;
}
