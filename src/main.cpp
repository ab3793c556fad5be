#include "rtbprice/base64.hpp"
#include "rtbprice/cli_colors.hpp"
#include "rtbprice/constants.hpp"
#include "rtbprice/crypto.hpp"
#include "rtbprice/env.hpp"
#include "rtbprice/errors.hpp"
#include "rtbprice/keys.hpp"
#include "rtbprice/price.hpp"

#include <cctype>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using rtbprice::cli::PrintDebug;
using rtbprice::cli::PrintError;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << rtbprice::cli::Cyan("Usage:") << "\n";
    std::cout << "  rtbprice_cli encrypt <price> [--iv <hex>] [--ic <key>] [--ec <key>] [--key-encoding <variant>]\n";
    std::cout << "  rtbprice_cli decrypt <encoded> [--ic <key>] [--ec <key>] [--key-encoding <variant>]\n";
    std::cout << "  rtbprice_cli gen-iv\n";
    std::cout << "  rtbprice_cli version\n";
    std::cout << "\n";
    std::cout << "Variants: url (default), url-raw, std, std-raw\n";
    std::cout << "Without --ic/--ec the keys are read from " << rtbprice::constants::kEnvIntegrityKey << " and "
              << rtbprice::constants::kEnvEncryptionKey << ".\n";
    std::cout << "Global flags (before or after the command): --no-color, -v/--verbose\n";
    std::cout << "Use -- before an encoded price to stop option parsing.\n";
}

struct ParsedOptions {
    std::string input;
    std::optional<std::string> integrity_key;
    std::optional<std::string> encryption_key;
    std::optional<std::string> key_encoding;
    std::optional<std::string> iv_hex;
    bool verbose = false;
};

std::string RequireValue(int argc, char** argv, int idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw UsageError("Missing value for " + flag);
    }
    return argv[idx + 1];
}

bool ApplyGlobalFlag(const std::string& flag, bool* verbose) {
    if (flag == "-v" || flag == "--verbose") {
        *verbose = true;
        return true;
    }
    if (flag == "--no-color") {
        rtbprice::cli::SetColorsEnabled(false);
        return true;
    }
    return false;
}

// The payload is taken verbatim even when it starts with '-', since the
// URL-safe alphabet uses '-' as a symbol. "--" ends option parsing.
ParsedOptions ParsePriceArgs(int argc, char** argv, int start_index, bool allow_iv) {
    ParsedOptions opts;
    bool options_done = false;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (options_done) {
            if (!opts.input.empty()) {
                throw UsageError("Unexpected argument: " + flag);
            }
            opts.input = flag;
            idx += 1;
        } else if (flag == "--") {
            options_done = true;
            idx += 1;
        } else if (flag == "--ic") {
            opts.integrity_key = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--ec") {
            opts.encryption_key = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--key-encoding") {
            opts.key_encoding = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--iv" && allow_iv) {
            opts.iv_hex = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (ApplyGlobalFlag(flag, &opts.verbose)) {
            idx += 1;
        } else if (opts.input.empty()) {
            opts.input = flag;
            idx += 1;
        } else if (flag.size() > 1 && flag[0] == '-') {
            throw UsageError("Unknown flag: " + flag);
        } else {
            throw UsageError("Unexpected argument: " + flag);
        }
    }
    if (opts.input.empty()) {
        throw UsageError("Missing payload");
    }
    return opts;
}

rtbprice::keys::KeyPair ResolveKeys(const ParsedOptions& opts) {
    std::optional<rtbprice::base64::Variant> variant;
    if (opts.key_encoding) {
        variant = rtbprice::base64::VariantFromFlag(*opts.key_encoding);
    }
    if (!opts.integrity_key && !opts.encryption_key) {
        return rtbprice::keys::LoadKeysFromEnv(variant);
    }
    if (!opts.integrity_key || !opts.encryption_key) {
        throw UsageError("--ic and --ec must be given together");
    }
    if (!variant) {
        variant = rtbprice::base64::VariantFromFlag(
            rtbprice::env::Get(rtbprice::constants::kEnvKeyEncoding, rtbprice::constants::kDefaultKeyEncoding));
    }
    return rtbprice::keys::ParseKeys(*variant, *opts.integrity_key, *opts.encryption_key);
}

std::uint64_t ParsePrice(const std::string& text) {
    if (text.empty() || text.size() > 20) {
        throw UsageError("Invalid price: " + text);
    }
    for (unsigned char ch : text) {
        if (!std::isdigit(ch)) {
            throw UsageError("Invalid price: " + text);
        }
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw UsageError("Price out of range: " + text);
    }
}

int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

std::vector<std::uint8_t> ParseHex(const std::string& text) {
    if (text.size() % 2 != 0) {
        throw UsageError("Hex string must have an even length");
    }
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = HexValue(text[i]);
        int lo = HexValue(text[i + 1]);
        if (hi < 0 || lo < 0) {
            throw UsageError("Invalid hex string: " + text);
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string ToHex(const std::vector<std::uint8_t>& data) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

}  // namespace

int main(int argc, char** argv) {
    bool verbose = rtbprice::env::IsEnabled(rtbprice::constants::kEnvVerbose);
    int command_index = 1;
    while (command_index < argc && ApplyGlobalFlag(argv[command_index], &verbose)) {
        ++command_index;
    }
    if (command_index >= argc) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[command_index]);
    const int args_index = command_index + 1;
    try {
        if (command == "version" || command == "--version") {
            std::cout << "rtbprice " << rtbprice::constants::kVersion << "\n";
            return 0;
        }
        if (command == "gen-iv") {
            std::cout << ToHex(rtbprice::crypto::RandomBytes(rtbprice::constants::kIvLen)) << "\n";
            return 0;
        }
        if (command == "encrypt") {
            ParsedOptions opts = ParsePriceArgs(argc, argv, args_index, true);
            verbose = verbose || opts.verbose;
            std::uint64_t price = ParsePrice(opts.input);
            rtbprice::keys::KeyPair keys = ResolveKeys(opts);
            if (opts.iv_hex) {
                std::cout << rtbprice::price::EncryptPrice(keys, ParseHex(*opts.iv_hex), price) << "\n";
            } else {
                if (verbose) {
                    PrintDebug("no --iv given, drawing a random initialization vector");
                }
                std::cout << rtbprice::price::EncryptPriceRandomIv(keys, price) << "\n";
            }
            return 0;
        }
        if (command == "decrypt") {
            ParsedOptions opts = ParsePriceArgs(argc, argv, args_index, false);
            verbose = verbose || opts.verbose;
            rtbprice::keys::KeyPair keys = ResolveKeys(opts);
            std::cout << rtbprice::price::DecryptPrice(keys, opts.input) << "\n";
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        PrintError(exc.what());
        PrintUsage();
        return 2;
    } catch (const rtbprice::PriceError& exc) {
        PrintError(exc.what());
        if (verbose) {
            PrintDebug(rtbprice::PriceErrorCodeName(exc.code()) + ": " + exc.detail());
        }
        return 1;
    } catch (const rtbprice::KeyDecodeError& exc) {
        PrintError(exc.what());
        return 1;
    } catch (const std::exception& exc) {
        PrintError(exc.what());
        return 1;
    }
}
