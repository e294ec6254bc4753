#pragma once

#include "crypto_types.hpp"
#include <string>
#include <vector>
#include <span>
#include <cstdint>

namespace relaysave::crypto {

// Versioned, padded ChaCha20 + HMAC-SHA256 envelope carried as base64 text.
//
// Decoded layout: version(1) | nonce(32) | ciphertext | mac(32)
// The ciphertext encrypts: be16 length | plaintext | zero padding.
//
// Decryption validates in a fixed order and reports the first failure:
// payload length, version marker, base64, decoded length, version byte,
// MAC (checked before any decryption), padding.
class PayloadCipher {
public:
    static constexpr std::uint8_t VERSION = 2;
    static constexpr char FUTURE_VERSION_MARKER = '#';
    
    static constexpr size_t MIN_PAYLOAD_CHARS = 132;
    static constexpr size_t MAX_PAYLOAD_CHARS = 87472;
    static constexpr size_t MIN_DECODED_SIZE = 99;
    static constexpr size_t MAX_DECODED_SIZE = 65603;
    static constexpr size_t MIN_PLAINTEXT_SIZE = 1;
    static constexpr size_t MAX_PLAINTEXT_SIZE = 65535;
    
    static constexpr size_t MESSAGE_KEYS_SIZE = 76;
    
    // Length the plaintext is padded to, excluding the 2-byte length prefix.
    static size_t padded_length(size_t plaintext_length);
    
    static CryptoResult decrypt(const std::string& payload,
                                std::span<const std::uint8_t> secret_key,
                                const PublicKey& peer_public_key,
                                std::vector<std::uint8_t>& out_plaintext);
    
    static CryptoResult decrypt(const std::string& payload,
                                const ConversationKey& conversation_key,
                                std::vector<std::uint8_t>& out_plaintext);
    
    static CryptoResult encrypt(std::span<const std::uint8_t> plaintext,
                                const ConversationKey& conversation_key,
                                const PayloadNonce& nonce,
                                std::string& out_payload);
    
    static CryptoResult encrypt(std::span<const std::uint8_t> plaintext,
                                const ConversationKey& conversation_key,
                                std::string& out_payload);

private:
    struct MessageKeys;
    struct DecodedPayload;
    
    static CryptoResult decode(const std::string& payload, DecodedPayload& out_decoded);
    
    static CryptoResult open(const DecodedPayload& decoded,
                             const ConversationKey& conversation_key,
                             std::vector<std::uint8_t>& out_plaintext);
    
    static CryptoResult derive_message_keys(const ConversationKey& conversation_key,
                                            std::span<const std::uint8_t> nonce,
                                            MessageKeys& out_keys);
    
    static CryptoResult unpad(std::span<const std::uint8_t> padded,
                              std::vector<std::uint8_t>& out_plaintext);
};

}
