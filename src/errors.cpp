#include "rtbprice/errors.hpp"

namespace rtbprice {

namespace {

std::string KeyDecodeMessage(KeyRole role, const std::string& cause) {
    return "could not decode price " + KeyRoleName(role) + " key: " + cause;
}

std::string PublicMessage(PriceErrorCode code, const std::string& detail) {
    switch (code) {
        case PriceErrorCode::EmptyKey:
            return "encryption and integrity keys are required";
        case PriceErrorCode::InvalidIvLength:
            return "invalid initialization vector: " + detail;
        case PriceErrorCode::WrongEncodedLength:
            return "price is invalid: " + detail;
        case PriceErrorCode::Base64DecodeFailure:
            return "price is invalid: invalid base64 string";
        case PriceErrorCode::WrongDecodedLength:
            return "price is invalid: " + detail;
        case PriceErrorCode::IntegrityFailure:
            return "price integrity is invalid";
    }
    return "price is invalid";
}

}  // namespace

std::string KeyRoleName(KeyRole role) {
    switch (role) {
        case KeyRole::Integrity:
            return "integrity";
        case KeyRole::Encryption:
            return "encryption";
    }
    return "unknown";
}

std::string PriceErrorCodeName(PriceErrorCode code) {
    switch (code) {
        case PriceErrorCode::EmptyKey:
            return "EmptyKey";
        case PriceErrorCode::InvalidIvLength:
            return "InvalidIvLength";
        case PriceErrorCode::WrongEncodedLength:
            return "WrongEncodedLength";
        case PriceErrorCode::Base64DecodeFailure:
            return "Base64DecodeFailure";
        case PriceErrorCode::WrongDecodedLength:
            return "WrongDecodedLength";
        case PriceErrorCode::IntegrityFailure:
            return "IntegrityFailure";
    }
    return "Unknown";
}

KeyDecodeError::KeyDecodeError(KeyRole role, const std::string& cause)
    : std::runtime_error(KeyDecodeMessage(role, cause)), role_(role), cause_(cause) {}

PriceError::PriceError(PriceErrorCode code, const std::string& detail)
    : std::runtime_error(PublicMessage(code, detail)), code_(code), detail_(detail) {}

}  // namespace rtbprice
