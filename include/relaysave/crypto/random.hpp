#pragma once

#include "crypto_types.hpp"
#include <span>
#include <cstdint>

namespace relaysave::crypto {

class SecureRandom {
public:
    static bool initialize();

    static CryptoResult generate_bytes(std::span<std::uint8_t> output);

    // Throws std::runtime_error if libsodium cannot be initialized.
    static PayloadNonce generate_payload_nonce();
};

}
