#include "relaysave/crypto/payload_cipher.hpp"
#include "relaysave/crypto/hash.hpp"
#include "relaysave/crypto/key_agreement.hpp"
#include "relaysave/crypto/random.hpp"
#include <sodium.h>
#include <algorithm>

namespace relaysave::crypto {

struct PayloadCipher::MessageKeys {
    SecureBytes material;
    
    const std::uint8_t* chacha_key() const { return material.data_ptr(); }
    const std::uint8_t* chacha_nonce() const { return material.data_ptr() + CHACHA20_KEY_SIZE; }
    std::span<const std::uint8_t> hmac_key() const {
        return material.span().subspan(CHACHA20_KEY_SIZE + CHACHA20_NONCE_SIZE, HMAC_SHA256_KEY_SIZE);
    }
};

struct PayloadCipher::DecodedPayload {
    std::vector<std::uint8_t> data;
    
    std::span<const std::uint8_t> nonce() const {
        return std::span<const std::uint8_t>(data).subspan(1, PAYLOAD_NONCE_SIZE);
    }
    std::span<const std::uint8_t> ciphertext() const {
        return std::span<const std::uint8_t>(data).subspan(
            1 + PAYLOAD_NONCE_SIZE, data.size() - 1 - PAYLOAD_NONCE_SIZE - PAYLOAD_MAC_SIZE);
    }
    std::span<const std::uint8_t> mac() const {
        return std::span<const std::uint8_t>(data).last(PAYLOAD_MAC_SIZE);
    }
};

size_t PayloadCipher::padded_length(size_t plaintext_length) {
    if (plaintext_length <= 32) {
        return 32;
    }
    
    size_t next_power = 1;
    while (next_power < plaintext_length) {
        next_power <<= 1;
    }
    
    size_t chunk = next_power <= 256 ? 32 : next_power / 8;
    return chunk * ((plaintext_length - 1) / chunk + 1);
}

CryptoResult PayloadCipher::decrypt(const std::string& payload,
                                    std::span<const std::uint8_t> secret_key,
                                    const PublicKey& peer_public_key,
                                    std::vector<std::uint8_t>& out_plaintext) {
    DecodedPayload decoded;
    auto result = decode(payload, decoded);
    if (!result) {
        return result;
    }
    
    ConversationKey conversation_key;
    result = KeyAgreement::derive_conversation_key(secret_key, peer_public_key, conversation_key);
    if (!result) {
        return result;
    }
    
    result = open(decoded, conversation_key, out_plaintext);
    sodium_memzero(conversation_key.data(), conversation_key.size());
    return result;
}

CryptoResult PayloadCipher::decrypt(const std::string& payload,
                                    const ConversationKey& conversation_key,
                                    std::vector<std::uint8_t>& out_plaintext) {
    DecodedPayload decoded;
    auto result = decode(payload, decoded);
    if (!result) {
        return result;
    }
    
    return open(decoded, conversation_key, out_plaintext);
}

CryptoResult PayloadCipher::decode(const std::string& payload, DecodedPayload& out_decoded) {
    if (!ensure_sodium_initialized()) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "libsodium initialization failed");
    }
    
    if (payload.size() < MIN_PAYLOAD_CHARS || payload.size() > MAX_PAYLOAD_CHARS) {
        return CryptoResult(CryptoError::INVALID_PAYLOAD_LENGTH,
                            "invalid payload length: " + std::to_string(payload.size()));
    }
    
    if (payload.front() == FUTURE_VERSION_MARKER) {
        return CryptoResult(CryptoError::UNKNOWN_VERSION, "unknown encryption version");
    }
    
    auto decoded = hash_utils::from_base64(payload);
    if (!decoded) {
        return CryptoResult(CryptoError::INVALID_BASE64, "invalid base64");
    }
    auto& data = out_decoded.data;
    data = std::move(*decoded);
    
    if (data.size() < MIN_DECODED_SIZE || data.size() > MAX_DECODED_SIZE) {
        return CryptoResult(CryptoError::INVALID_PAYLOAD_LENGTH,
                            "invalid data length: " + std::to_string(data.size()));
    }
    
    if (data[0] != VERSION) {
        return CryptoResult(CryptoError::UNKNOWN_VERSION,
                            "unknown encryption version " + std::to_string(data[0]));
    }
    
    return CryptoResult();
}

CryptoResult PayloadCipher::open(const DecodedPayload& decoded,
                                 const ConversationKey& conversation_key,
                                 std::vector<std::uint8_t>& out_plaintext) {
    MessageKeys keys;
    auto result = derive_message_keys(conversation_key, decoded.nonce(), keys);
    if (!result) {
        return result;
    }
    
    auto ciphertext = decoded.ciphertext();
    auto expected_mac = HmacSha256::compute(keys.hmac_key(), {decoded.nonce(), ciphertext});
    if (sodium_memcmp(expected_mac.data(), decoded.mac().data(), PAYLOAD_MAC_SIZE) != 0) {
        return CryptoResult(CryptoError::INVALID_MAC, "invalid MAC");
    }
    
    SecureBytes padded(ciphertext.size());
    crypto_stream_chacha20_ietf_xor_ic(padded.data_ptr(), ciphertext.data(), ciphertext.size(),
                                       keys.chacha_nonce(), 0, keys.chacha_key());
    
    return unpad(padded.span(), out_plaintext);
}

CryptoResult PayloadCipher::encrypt(std::span<const std::uint8_t> plaintext,
                                    const ConversationKey& conversation_key,
                                    const PayloadNonce& nonce,
                                    std::string& out_payload) {
    if (!ensure_sodium_initialized()) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "libsodium initialization failed");
    }
    
    if (plaintext.size() < MIN_PLAINTEXT_SIZE || plaintext.size() > MAX_PLAINTEXT_SIZE) {
        return CryptoResult(CryptoError::INVALID_PLAINTEXT,
                            "plaintext length out of range: " + std::to_string(plaintext.size()));
    }
    
    SecureBytes padded(2 + padded_length(plaintext.size()));
    padded.data[0] = static_cast<std::uint8_t>(plaintext.size() >> 8);
    padded.data[1] = static_cast<std::uint8_t>(plaintext.size() & 0xFF);
    std::copy(plaintext.begin(), plaintext.end(), padded.data.begin() + 2);
    
    MessageKeys keys;
    auto result = derive_message_keys(conversation_key, nonce, keys);
    if (!result) {
        return result;
    }
    
    std::vector<std::uint8_t> data(1 + PAYLOAD_NONCE_SIZE + padded.size() + PAYLOAD_MAC_SIZE);
    data[0] = VERSION;
    std::copy(nonce.begin(), nonce.end(), data.begin() + 1);
    
    auto* ciphertext = data.data() + 1 + PAYLOAD_NONCE_SIZE;
    crypto_stream_chacha20_ietf_xor_ic(ciphertext, padded.data_ptr(), padded.size(),
                                       keys.chacha_nonce(), 0, keys.chacha_key());
    
    auto mac = HmacSha256::compute(keys.hmac_key(), {
        std::span<const std::uint8_t>(nonce),
        std::span<const std::uint8_t>(ciphertext, padded.size())
    });
    std::copy(mac.begin(), mac.end(), data.end() - PAYLOAD_MAC_SIZE);
    
    out_payload = hash_utils::to_base64(data);
    return CryptoResult();
}

CryptoResult PayloadCipher::encrypt(std::span<const std::uint8_t> plaintext,
                                    const ConversationKey& conversation_key,
                                    std::string& out_payload) {
    PayloadNonce nonce{};
    auto nonce_result = SecureRandom::generate_bytes(nonce);
    if (!nonce_result) {
        return nonce_result;
    }
    return encrypt(plaintext, conversation_key, nonce, out_payload);
}

CryptoResult PayloadCipher::derive_message_keys(const ConversationKey& conversation_key,
                                                std::span<const std::uint8_t> nonce,
                                                MessageKeys& out_keys) {
    return Hkdf::expand(conversation_key, nonce, MESSAGE_KEYS_SIZE, out_keys.material);
}

CryptoResult PayloadCipher::unpad(std::span<const std::uint8_t> padded,
                                  std::vector<std::uint8_t>& out_plaintext) {
    if (padded.size() < 2) {
        return CryptoResult(CryptoError::INVALID_PADDING, "invalid padding");
    }
    
    size_t unpadded_len = (static_cast<size_t>(padded[0]) << 8) | padded[1];
    size_t available = std::min(unpadded_len, padded.size() - 2);
    
    if (unpadded_len < MIN_PLAINTEXT_SIZE ||
        unpadded_len > MAX_PLAINTEXT_SIZE ||
        available != unpadded_len ||
        padded.size() != 2 + padded_length(unpadded_len)) {
        return CryptoResult(CryptoError::INVALID_PADDING, "invalid padding");
    }
    
    out_plaintext.assign(padded.begin() + 2, padded.begin() + 2 + unpadded_len);
    return CryptoResult();
}

}
