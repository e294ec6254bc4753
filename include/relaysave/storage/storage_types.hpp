#pragma once

#include "../crypto/crypto_types.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace relaysave::storage {

// Protocol version accepted for index and manifest payloads
constexpr int SUPPORTED_PROTOCOL_VERSION = 2;

enum class EncryptionMode {
    None,
    Sealed
};

// Wire spelling: "none" and "nip44"
const char* to_wire_string(EncryptionMode mode);
std::optional<EncryptionMode> parse_encryption_mode(const std::string& wire);

enum class FetchError {
    SUCCESS = 0,
    NOT_FOUND,
    UNSUPPORTED_VERSION,
    PARSE_ERROR,
    CHUNK_COUNT_MISMATCH,
    DECRYPTION_FAILED,
    CANCELLED,
    MISSING_SECRET_KEY,
    INTEGRITY_MISMATCH,
    NOT_PREVIEWABLE
};

const char* to_string(FetchError error);

struct FetchResult {
    FetchError error;
    std::string message;
    // Set for DECRYPTION_FAILED
    crypto::CryptoError crypto_error;
    
    FetchResult(FetchError err = FetchError::SUCCESS, std::string msg = "",
                crypto::CryptoError detail = crypto::CryptoError::SUCCESS)
        : error(err), message(std::move(msg)), crypto_error(detail) {}
    
    static FetchResult decryption_failed(const crypto::CryptoResult& cause, const std::string& context);
    
    bool success() const { return error == FetchError::SUCCESS; }
    operator bool() const { return success(); }
};

}
