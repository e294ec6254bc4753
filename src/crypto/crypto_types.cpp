#include "relaysave/crypto/crypto_types.hpp"
#include <algorithm>
#include <cstring>

#include <sodium.h>

namespace relaysave::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(const std::vector<std::uint8_t>& bytes) : data(bytes) {}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes) 
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept 
    : data(std::move(other.data)) {
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
    }
    return *this;
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

void SecureBytes::resize(size_t new_size) {
    // Grow through a fresh buffer so the old allocation is wiped, not just freed
    if (new_size > data.capacity()) {
        std::vector<std::uint8_t> grown(new_size, 0);
        std::copy(data.begin(), data.end(), grown.begin());
        clear();
        data = std::move(grown);
        return;
    }

    size_t old_size = data.size();
    if (new_size < old_size) {
        sodium_memzero(data.data() + new_size, old_size - new_size);
    }
    data.resize(new_size, 0);
}

const char* to_string(CryptoError error) {
    switch (error) {
        case CryptoError::SUCCESS: return "success";
        case CryptoError::INVALID_PAYLOAD_LENGTH: return "invalid payload length";
        case CryptoError::UNKNOWN_VERSION: return "unknown encryption version";
        case CryptoError::INVALID_BASE64: return "invalid base64";
        case CryptoError::INVALID_MAC: return "invalid MAC";
        case CryptoError::INVALID_PADDING: return "invalid padding";
        case CryptoError::INVALID_KEY: return "invalid key";
        case CryptoError::INVALID_PLAINTEXT: return "invalid plaintext";
        case CryptoError::KEY_AGREEMENT_FAILED: return "key agreement failed";
        case CryptoError::INITIALIZATION_FAILED: return "initialization failed";
    }
    return "unknown error";
}

bool ensure_sodium_initialized() {
    static const bool initialized = sodium_init() >= 0;
    return initialized;
}

}
