#include "relaysave/storage/storage_types.hpp"

namespace relaysave::storage {

const char* to_wire_string(EncryptionMode mode) {
    return mode == EncryptionMode::Sealed ? "nip44" : "none";
}

std::optional<EncryptionMode> parse_encryption_mode(const std::string& wire) {
    if (wire == "none") {
        return EncryptionMode::None;
    }
    if (wire == "nip44") {
        return EncryptionMode::Sealed;
    }
    return std::nullopt;
}

const char* to_string(FetchError error) {
    switch (error) {
        case FetchError::SUCCESS: return "success";
        case FetchError::NOT_FOUND: return "not found";
        case FetchError::UNSUPPORTED_VERSION: return "unsupported version";
        case FetchError::PARSE_ERROR: return "parse error";
        case FetchError::CHUNK_COUNT_MISMATCH: return "chunk count mismatch";
        case FetchError::DECRYPTION_FAILED: return "decryption failed";
        case FetchError::CANCELLED: return "cancelled";
        case FetchError::MISSING_SECRET_KEY: return "missing secret key";
        case FetchError::INTEGRITY_MISMATCH: return "integrity mismatch";
        case FetchError::NOT_PREVIEWABLE: return "not previewable";
    }
    return "unknown";
}

FetchResult FetchResult::decryption_failed(const crypto::CryptoResult& cause, const std::string& context) {
    std::string message = context + ": " + crypto::to_string(cause.error);
    if (!cause.message.empty()) {
        message += " (" + cause.message + ")";
    }
    return FetchResult(FetchError::DECRYPTION_FAILED, std::move(message), cause.error);
}

}
