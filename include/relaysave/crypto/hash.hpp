#pragma once

#include "crypto_types.hpp"
#include <string>
#include <vector>
#include <span>
#include <optional>
#include <cstdint>

namespace relaysave::crypto {

class Sha256Hasher {
public:
    static Sha256Hash hash(std::span<const std::uint8_t> data);
};

class HmacSha256 {
public:
    static HmacSha256Tag compute(std::span<const std::uint8_t> key,
                                 std::span<const std::uint8_t> message);

    // HMAC over the concatenation of the parts, without building the buffer.
    static HmacSha256Tag compute(std::span<const std::uint8_t> key,
                                 const std::vector<std::span<const std::uint8_t>>& parts);
};

// RFC 5869 with SHA-256
class Hkdf {
public:
    static constexpr size_t MAX_OUTPUT_SIZE = 255 * SHA256_HASH_SIZE;

    static Sha256Hash extract(std::span<const std::uint8_t> salt,
                              std::span<const std::uint8_t> input_key_material);

    static CryptoResult expand(std::span<const std::uint8_t> pseudo_random_key,
                               std::span<const std::uint8_t> info,
                               size_t length,
                               SecureBytes& out_key_material);
};

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes);

std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex_string);

std::string sha256_hex(std::span<const std::uint8_t> data);

// Standard alphabet with padding. Decoding rejects trailing garbage.
std::string to_base64(std::span<const std::uint8_t> bytes);
std::optional<std::vector<std::uint8_t>> from_base64(const std::string& text);

}

}
