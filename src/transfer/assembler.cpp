#include "relaysave/transfer/assembler.hpp"
#include "relaysave/crypto/hash.hpp"
#include "relaysave/crypto/key_agreement.hpp"
#include "relaysave/crypto/payload_cipher.hpp"
#include "relaysave/core/logger.hpp"
#include <sodium.h>
#include <algorithm>

namespace relaysave::transfer {

storage::FetchResult Assembler::decode_chunks(const std::vector<storage::ChunkRecord>& chunks,
                                              std::uint32_t total_chunks,
                                              storage::EncryptionMode mode,
                                              const SealingKeys* keys,
                                              std::vector<std::vector<std::uint8_t>>& out_parts) {
    if (chunks.size() != total_chunks) {
        return storage::FetchResult(storage::FetchError::CHUNK_COUNT_MISMATCH,
                                    "Missing chunks: got " + std::to_string(chunks.size()) + "/" +
                                    std::to_string(total_chunks));
    }
    
    std::vector<const storage::ChunkRecord*> ordered;
    ordered.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        ordered.push_back(&chunk);
    }
    std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        return a->index < b->index;
    });
    
    for (std::uint32_t i = 0; i < ordered.size(); ++i) {
        if (ordered[i]->index != i) {
            return storage::FetchResult(storage::FetchError::CHUNK_COUNT_MISMATCH,
                                        "Chunk " + std::to_string(i) + " of " +
                                        std::to_string(total_chunks) + " is missing");
        }
    }
    
    crypto::ConversationKey conversation_key{};
    if (mode == storage::EncryptionMode::Sealed) {
        if (!keys || keys->secret_key.empty()) {
            return storage::FetchResult(storage::FetchError::MISSING_SECRET_KEY,
                                        "A secret key is required to decrypt this file");
        }
        
        auto result = crypto::KeyAgreement::derive_conversation_key(keys->secret_key, keys->owner_key,
                                                                   conversation_key);
        if (!result) {
            return storage::FetchResult::decryption_failed(result, "Key agreement");
        }
    }
    
    std::vector<std::vector<std::uint8_t>> parts;
    parts.reserve(ordered.size());
    
    for (const auto* chunk : ordered) {
        std::vector<std::uint8_t> bytes;
        
        if (mode == storage::EncryptionMode::Sealed) {
            auto result = crypto::PayloadCipher::decrypt(chunk->content, conversation_key, bytes);
            if (!result) {
                sodium_memzero(conversation_key.data(), conversation_key.size());
                LOG_WARN("Chunk {} failed to decrypt: {}", chunk->index, crypto::to_string(result.error));
                return storage::FetchResult::decryption_failed(result, "Chunk " + std::to_string(chunk->index));
            }
        } else {
            auto decoded = crypto::hash_utils::from_base64(chunk->content);
            if (!decoded) {
                return storage::FetchResult(storage::FetchError::PARSE_ERROR,
                                            "Chunk " + std::to_string(chunk->index) + " is not valid base64");
            }
            bytes = std::move(*decoded);
        }
        
        parts.push_back(std::move(bytes));
    }
    
    sodium_memzero(conversation_key.data(), conversation_key.size());
    out_parts = std::move(parts);
    return storage::FetchResult();
}

storage::FetchResult Assembler::assemble(const std::vector<storage::ChunkRecord>& chunks,
                                         std::uint32_t total_chunks,
                                         storage::EncryptionMode mode,
                                         const SealingKeys* keys,
                                         std::vector<std::uint8_t>& out_data) {
    std::vector<std::vector<std::uint8_t>> parts;
    auto result = decode_chunks(chunks, total_chunks, mode, keys, parts);
    if (!result) {
        return result;
    }
    
    out_data = concatenate(parts);
    return result;
}

std::vector<std::uint8_t> Assembler::concatenate(const std::vector<std::vector<std::uint8_t>>& parts) {
    size_t total = 0;
    for (const auto& part : parts) {
        total += part.size();
    }
    
    std::vector<std::uint8_t> data;
    data.reserve(total);
    for (const auto& part : parts) {
        data.insert(data.end(), part.begin(), part.end());
    }
    return data;
}

}
