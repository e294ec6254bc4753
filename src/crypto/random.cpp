#include "relaysave/crypto/random.hpp"
#include "relaysave/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace relaysave::crypto {

bool SecureRandom::initialize() {
    if (!ensure_sodium_initialized()) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    return true;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "Random generator not initialized");
    }
    if (output.empty()) {
        return CryptoResult(CryptoError::INVALID_PLAINTEXT, "Output buffer is empty");
    }

    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

PayloadNonce SecureRandom::generate_payload_nonce() {
    PayloadNonce nonce{};
    auto result = generate_bytes(nonce);
    if (!result.success()) {
        throw std::runtime_error("Failed to generate payload nonce: " + result.message);
    }
    return nonce;
}

}
