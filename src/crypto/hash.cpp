#include "relaysave/crypto/hash.hpp"
#include <sodium.h>
#include <algorithm>

namespace relaysave::crypto {

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

HmacSha256Tag HmacSha256::compute(std::span<const std::uint8_t> key,
                                  std::span<const std::uint8_t> message) {
    return compute(key, std::vector<std::span<const std::uint8_t>>{message});
}

HmacSha256Tag HmacSha256::compute(std::span<const std::uint8_t> key,
                                  const std::vector<std::span<const std::uint8_t>>& parts) {
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    
    for (const auto& part : parts) {
        crypto_auth_hmacsha256_update(&state, part.data(), part.size());
    }
    
    HmacSha256Tag tag;
    crypto_auth_hmacsha256_final(&state, tag.data());
    sodium_memzero(&state, sizeof(state));
    return tag;
}

Sha256Hash Hkdf::extract(std::span<const std::uint8_t> salt,
                         std::span<const std::uint8_t> input_key_material) {
    return HmacSha256::compute(salt, input_key_material);
}

CryptoResult Hkdf::expand(std::span<const std::uint8_t> pseudo_random_key,
                          std::span<const std::uint8_t> info,
                          size_t length,
                          SecureBytes& out_key_material) {
    if (pseudo_random_key.size() < SHA256_HASH_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY, "HKDF pseudo-random key too short");
    }
    
    if (length == 0 || length > MAX_OUTPUT_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY, "HKDF output length out of range");
    }
    
    SecureBytes output(length);
    HmacSha256Tag previous{};
    size_t previous_size = 0;
    size_t offset = 0;
    
    for (std::uint8_t counter = 1; offset < length; ++counter) {
        std::array<std::uint8_t, 1> counter_byte{counter};
        previous = HmacSha256::compute(pseudo_random_key, {
            std::span<const std::uint8_t>(previous.data(), previous_size),
            info,
            std::span<const std::uint8_t>(counter_byte)
        });
        previous_size = previous.size();
        
        size_t take = std::min(previous.size(), length - offset);
        std::copy(previous.begin(), previous.begin() + take, output.data.begin() + offset);
        offset += take;
    }
    
    sodium_memzero(previous.data(), previous.size());
    out_key_material = std::move(output);
    return CryptoResult();
}

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex_string) {
    if (hex_string.size() % 2 != 0) {
        return std::nullopt;
    }
    
    std::vector<std::uint8_t> bytes(hex_string.size() / 2);
    size_t decoded_len = 0;
    const char* hex_end = nullptr;
    
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex_string.data(), hex_string.size(),
                       nullptr, &decoded_len, &hex_end) != 0) {
        return std::nullopt;
    }
    
    if (decoded_len != bytes.size() || hex_end != hex_string.data() + hex_string.size()) {
        return std::nullopt;
    }
    
    return bytes;
}

std::string sha256_hex(std::span<const std::uint8_t> data) {
    auto hash = Sha256Hasher::hash(data);
    return to_hex(hash);
}

std::string to_base64(std::span<const std::uint8_t> bytes) {
    std::string encoded(sodium_base64_ENCODED_LEN(bytes.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), bytes.data(), bytes.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    encoded.pop_back();
    return encoded;
}

std::optional<std::vector<std::uint8_t>> from_base64(const std::string& text) {
    if (!ensure_sodium_initialized()) {
        return std::nullopt;
    }
    
    std::vector<std::uint8_t> bytes(text.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* b64_end = nullptr;
    
    if (sodium_base642bin(bytes.data(), bytes.size(), text.data(), text.size(),
                          nullptr, &decoded_len, &b64_end, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    
    if (b64_end != text.data() + text.size()) {
        return std::nullopt;
    }
    
    bytes.resize(decoded_len);
    return bytes;
}

}

}
