#pragma once

#include "crypto_types.hpp"
#include <span>
#include <string>
#include <cstdint>

namespace relaysave::crypto {

// secp256k1 key agreement for the sealed chunk scheme. Public keys are
// x-only; the peer point is lifted to its even-y representative.
class KeyAgreement {
public:
    static constexpr const char* CONVERSATION_KEY_SALT = "nip44-v2";

    // HKDF-Extract(salt = "nip44-v2", ikm = shared x coordinate). Symmetric:
    // (a, pub(b)) and (b, pub(a)) yield the same key.
    static CryptoResult derive_conversation_key(std::span<const std::uint8_t> secret_key,
                                                const PublicKey& peer_public_key,
                                                ConversationKey& out_key);
    
    static CryptoResult derive_public_key(std::span<const std::uint8_t> secret_key,
                                          PublicKey& out_public_key);
    
    static bool is_valid_secret_key(std::span<const std::uint8_t> secret_key);
    static bool is_valid_public_key(const PublicKey& public_key);
};

// Pass/fail parsing of the hex key forms accepted on the command line.
namespace key_utils {

CryptoResult parse_secret_key_hex(const std::string& hex, SecureBytes& out_secret_key);
CryptoResult parse_public_key_hex(const std::string& hex, PublicKey& out_public_key);

}

}
