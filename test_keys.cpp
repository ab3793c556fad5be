#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "rtbprice/base64.hpp"
#include "rtbprice/errors.hpp"
#include "rtbprice/keys.hpp"
#include "rtbprice/price.hpp"

namespace {

using rtbprice::KeyDecodeError;
using rtbprice::KeyRole;
using rtbprice::base64::Variant;

const char kIntegrityUrl[] = "arO23ykdNqUQ5LEoQ0FVmPkBd7xB5CO89PDZlSjpFxo=";
const char kEncryptionUrl[] = "skU7Ax_NL5pPAFyKdkfZjZz2-VhIN8bjj1rVFOaJ_5o=";
const char kEncryptionStd[] = "skU7Ax/NL5pPAFyKdkfZjZz2+VhIN8bjj1rVFOaJ/5o=";

int g_failures = 0;

void Check(bool cond, const std::string& label) {
    std::cout << "  " << label << ": " << (cond ? "ok" : "FAILED") << std::endl;
    if (!cond) {
        ++g_failures;
    }
}

template <typename Fn>
bool FailsFor(KeyRole role, Fn&& fn) {
    try {
        fn();
    } catch (const KeyDecodeError& exc) {
        return exc.role() == role && !exc.cause().empty();
    }
    return false;
}

void ClearEnv() {
    unsetenv("RTBPRICE_INTEGRITY_KEY");
    unsetenv("RTBPRICE_ENCRYPTION_KEY");
    unsetenv("RTBPRICE_KEY_ENCODING");
}

void TestParseKeys() {
    std::cout << "ParseKeys:" << std::endl;
    rtbprice::keys::KeyPair keys = rtbprice::keys::ParseKeys(Variant::UrlSafe, kIntegrityUrl, kEncryptionUrl);
    Check(keys.integrity.size() == 32 && keys.encryption.size() == 32, "both keys are 32 bytes");
    Check(keys.integrity[0] == 0x6a && keys.integrity[1] == 0xb3 && keys.integrity[31] == 0x1a,
          "integrity key bytes");
    Check(keys.encryption[0] == 0xb2 && keys.encryption[1] == 0x45 && keys.encryption[31] == 0x9a,
          "encryption key bytes");

    rtbprice::keys::KeyPair std_keys = rtbprice::keys::ParseKeys(Variant::Standard, kIntegrityUrl, kEncryptionStd);
    Check(std_keys.encryption == keys.encryption, "standard alphabet yields the same key");

    std::string integrity_raw(kIntegrityUrl);
    integrity_raw.pop_back();
    std::string encryption_raw(kEncryptionUrl);
    encryption_raw.pop_back();
    rtbprice::keys::KeyPair raw_keys = rtbprice::keys::ParseKeys(Variant::UrlSafeRaw, integrity_raw, encryption_raw);
    Check(raw_keys.integrity == keys.integrity && raw_keys.encryption == keys.encryption,
          "unpadded variant yields the same keys");

    Check(FailsFor(KeyRole::Encryption,
                   [] { rtbprice::keys::ParseKeys(Variant::UrlSafe, kIntegrityUrl, kEncryptionStd); }),
          "standard alphabet rejected by url variant");
    Check(FailsFor(KeyRole::Integrity,
                   [] { rtbprice::keys::ParseKeys(Variant::UrlSafe, "not base64!", kEncryptionUrl); }),
          "malformed integrity key names the integrity key");
    Check(FailsFor(KeyRole::Integrity,
                   [&] { rtbprice::keys::ParseKeys(Variant::UrlSafe, integrity_raw, kEncryptionUrl); }),
          "missing padding rejected by padded variant");
    Check(FailsFor(KeyRole::Encryption,
                   [] { rtbprice::keys::ParseKeys(Variant::UrlSafeRaw, "arO2", kEncryptionUrl); }),
          "padding rejected by raw variant");

    try {
        rtbprice::keys::ParseKeys(Variant::UrlSafe, "not base64!", kEncryptionUrl);
        Check(false, "cause names the failing input byte");
    } catch (const KeyDecodeError& exc) {
        Check(exc.cause() == "illegal url base64 data at input byte 3", "cause names the failing input byte");
        Check(std::string(exc.what()).find("at input byte 3") != std::string::npos,
              "message names the failing input byte");
    }

    rtbprice::keys::KeyPair empty = rtbprice::keys::ParseKeys(Variant::UrlSafe, "", "");
    Check(empty.integrity.empty() && empty.encryption.empty(), "empty texts decode to empty keys");
    try {
        rtbprice::price::DecryptPrice(empty, "YWJjMTIzZGVmNDU2Z2hpN7fhCuPemCAWJRxOgA");
        Check(false, "empty keys refused by the codec");
    } catch (const rtbprice::PriceError& exc) {
        Check(exc.code() == rtbprice::PriceErrorCode::EmptyKey, "empty keys refused by the codec");
    }
}

void TestLoadKeysFromEnv() {
    std::cout << "LoadKeysFromEnv:" << std::endl;
    ClearEnv();
    Check(FailsFor(KeyRole::Integrity, [] { rtbprice::keys::LoadKeysFromEnv(); }), "missing integrity key");

    setenv("RTBPRICE_INTEGRITY_KEY", kIntegrityUrl, 1);
    Check(FailsFor(KeyRole::Encryption, [] { rtbprice::keys::LoadKeysFromEnv(); }), "missing encryption key");

    setenv("RTBPRICE_ENCRYPTION_KEY", kEncryptionUrl, 1);
    rtbprice::keys::KeyPair keys = rtbprice::keys::LoadKeysFromEnv();
    Check(rtbprice::price::DecryptPrice(keys, "YWJjMTIzZGVmNDU2Z2hpN7fhCuPemCAWJRxOgA") == 1900,
          "environment keys decrypt the sample price");

    setenv("RTBPRICE_KEY_ENCODING", "std", 1);
    setenv("RTBPRICE_ENCRYPTION_KEY", kEncryptionStd, 1);
    Check(rtbprice::keys::LoadKeysFromEnv().encryption == keys.encryption, "encoding variable selects the alphabet");

    unsetenv("RTBPRICE_KEY_ENCODING");
    Check(FailsFor(KeyRole::Encryption, [] { rtbprice::keys::LoadKeysFromEnv(); }),
          "default encoding rejects a standard-alphabet key");
    Check(rtbprice::keys::LoadKeysFromEnv(Variant::Standard).encryption == keys.encryption,
          "explicit variant overrides the default encoding");
    setenv("RTBPRICE_KEY_ENCODING", "url", 1);
    Check(rtbprice::keys::LoadKeysFromEnv(Variant::Standard).encryption == keys.encryption,
          "explicit variant overrides the encoding variable");

    setenv("RTBPRICE_KEY_ENCODING", "hex", 1);
    Check(rtbprice::keys::LoadKeysFromEnv(Variant::Standard).encryption == keys.encryption,
          "explicit variant ignores an unknown encoding variable");
    bool rejected = false;
    try {
        rtbprice::keys::LoadKeysFromEnv();
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    Check(rejected, "unknown encoding is rejected");
    ClearEnv();
}

}  // namespace

int main() {
    TestParseKeys();
    TestLoadKeysFromEnv();

    std::cout << "\n" << (g_failures == 0 ? "All key checks passed" : "Key checks FAILED: " + std::to_string(g_failures))
              << std::endl;
    return g_failures == 0 ? 0 : 1;
}
