#pragma once

#include <stdexcept>
#include <string>

namespace rtbprice {

enum class KeyRole {
    Integrity,
    Encryption
};

enum class PriceErrorCode {
    EmptyKey,
    InvalidIvLength,
    WrongEncodedLength,
    Base64DecodeFailure,
    WrongDecodedLength,
    IntegrityFailure
};

std::string KeyRoleName(KeyRole role);
std::string PriceErrorCodeName(PriceErrorCode code);

// Raised by key loading only. `cause()` is the underlying decode failure.
class KeyDecodeError : public std::runtime_error {
public:
    KeyDecodeError(KeyRole role, const std::string& cause);

    KeyRole role() const noexcept { return role_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    KeyRole role_;
    std::string cause_;
};

// Raised by EncryptPrice and DecryptPrice. what() is safe to hand to a peer;
// detail() is for local diagnostics only. IntegrityFailure always carries the
// same what() regardless of why verification failed.
class PriceError : public std::runtime_error {
public:
    PriceError(PriceErrorCode code, const std::string& detail);

    PriceErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    PriceErrorCode code_;
    std::string detail_;
};

}  // namespace rtbprice
