#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>

namespace relaysave::crypto {

// secp256k1 keys; public keys travel in x-only (BIP-340) form
constexpr size_t SECRET_KEY_SIZE = 32;
constexpr size_t PUBLIC_KEY_SIZE = 32;

constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t HMAC_SHA256_KEY_SIZE = 32;
constexpr size_t CONVERSATION_KEY_SIZE = 32;

constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;

constexpr size_t PAYLOAD_NONCE_SIZE = 32;
constexpr size_t PAYLOAD_MAC_SIZE = 32;

using PublicKey = std::array<std::uint8_t, PUBLIC_KEY_SIZE>;
using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;
using HmacSha256Tag = std::array<std::uint8_t, SHA256_HASH_SIZE>;
using ConversationKey = std::array<std::uint8_t, CONVERSATION_KEY_SIZE>;
using ChaCha20Key = std::array<std::uint8_t, CHACHA20_KEY_SIZE>;
using ChaCha20Nonce = std::array<std::uint8_t, CHACHA20_NONCE_SIZE>;
using PayloadNonce = std::array<std::uint8_t, PAYLOAD_NONCE_SIZE>;

// Secure memory utilities
struct SecureBytes {
    std::vector<std::uint8_t> data;
    
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(const std::vector<std::uint8_t>& bytes);
    SecureBytes(std::span<const std::uint8_t> bytes);
    
    ~SecureBytes();
    
    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;
    
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;
    
    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    
    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }
    
    void clear();
    void resize(size_t new_size);
};

// Error types for crypto operations. The payload errors are reported in
// the order the decryptor validates them.
enum class CryptoError {
    SUCCESS = 0,
    INVALID_PAYLOAD_LENGTH,
    UNKNOWN_VERSION,
    INVALID_BASE64,
    INVALID_MAC,
    INVALID_PADDING,
    INVALID_KEY,
    INVALID_PLAINTEXT,
    KEY_AGREEMENT_FAILED,
    INITIALIZATION_FAILED
};

const char* to_string(CryptoError error);

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

// Calls sodium_init() once per process; safe from any thread.
bool ensure_sodium_initialized();

}
