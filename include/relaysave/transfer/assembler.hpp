#pragma once

#include "../storage/chunk_cache.hpp"
#include "../storage/storage_types.hpp"
#include "../crypto/crypto_types.hpp"
#include <span>
#include <vector>
#include <cstdint>

namespace relaysave::transfer {

// Key material for sealed files. Chunks are sealed to the owner itself, so
// the peer key is the owner's public key.
struct SealingKeys {
    std::span<const std::uint8_t> secret_key;
    crypto::PublicKey owner_key{};
};

// Turns collected chunk records into file bytes in index order. Either every
// chunk decodes or nothing is produced.
class Assembler {
public:
    // Decoded bytes of each chunk, ordered by index.
    static storage::FetchResult decode_chunks(const std::vector<storage::ChunkRecord>& chunks,
                                              std::uint32_t total_chunks,
                                              storage::EncryptionMode mode,
                                              const SealingKeys* keys,
                                              std::vector<std::vector<std::uint8_t>>& out_parts);
    
    static storage::FetchResult assemble(const std::vector<storage::ChunkRecord>& chunks,
                                         std::uint32_t total_chunks,
                                         storage::EncryptionMode mode,
                                         const SealingKeys* keys,
                                         std::vector<std::uint8_t>& out_data);
    
    static std::vector<std::uint8_t> concatenate(const std::vector<std::vector<std::uint8_t>>& parts);
};

}
