#include "relaysave/transfer/file_fetcher.hpp"
#include "relaysave/crypto/hash.hpp"
#include "relaysave/crypto/key_agreement.hpp"
#include "relaysave/core/utils.hpp"
#include "relaysave/core/logger.hpp"

namespace relaysave::transfer {

namespace {

storage::FetchResult cancelled(const char* stage) {
    return storage::FetchResult(storage::FetchError::CANCELLED, std::string("Cancelled ") + stage);
}

}

FileFetcher::FileFetcher(network::RecordSource& source, storage::ChunkCache& cache,
                         std::vector<std::string> index_endpoints,
                         CollectorOptions collector_options)
    : index_endpoints_(std::move(index_endpoints))
    , manifest_resolver_(source, index_endpoints_)
    , collector_(source, cache, collector_options) {
}

storage::FetchResult FileFetcher::fetch(const std::string& owner_key, const std::string& content_hash,
                                        const FetchOptions& options, FetchedFile& out_file) {
    return run(owner_key, content_hash, options, false, out_file);
}

storage::FetchResult FileFetcher::preview(const std::string& owner_key, const std::string& content_hash,
                                          const FetchOptions& options, FetchedFile& out_file) {
    return run(owner_key, content_hash, options, true, out_file);
}

std::string FileFetcher::resolve_mime_type(const storage::Manifest& manifest) {
    if (manifest.mime_type && !manifest.mime_type->empty()) {
        return *manifest.mime_type;
    }
    
    auto guessed = core::utils::MimeUtils::from_file_name(manifest.file_name);
    return guessed.empty() ? DEFAULT_MIME_TYPE : guessed;
}

storage::FetchResult FileFetcher::run(const std::string& owner_key, const std::string& content_hash,
                                      const FetchOptions& options, bool preview_only, FetchedFile& out_file) {
    if (options.cancel.is_cancelled()) {
        return cancelled("before manifest lookup");
    }
    
    storage::Manifest manifest;
    auto result = manifest_resolver_.resolve(owner_key, content_hash, manifest);
    if (!result) {
        return result;
    }
    
    auto mime_type = resolve_mime_type(manifest);
    
    if (preview_only) {
        if (manifest.encryption == storage::EncryptionMode::Sealed) {
            return storage::FetchResult(storage::FetchError::NOT_PREVIEWABLE, "Sealed files cannot be previewed");
        }
        if (!core::utils::MimeUtils::is_previewable(mime_type)) {
            return storage::FetchResult(storage::FetchError::NOT_PREVIEWABLE,
                                        "Files of type " + mime_type + " cannot be previewed");
        }
    }
    
    SealingKeys keys;
    if (manifest.encryption == storage::EncryptionMode::Sealed) {
        if (options.secret_key.empty()) {
            return storage::FetchResult(storage::FetchError::MISSING_SECRET_KEY,
                                        manifest.file_name + " is sealed; a secret key is required");
        }
        
        auto key_result = crypto::key_utils::parse_public_key_hex(owner_key, keys.owner_key);
        if (!key_result) {
            return storage::FetchResult::decryption_failed(key_result, "Owner key");
        }
        keys.secret_key = options.secret_key;
    }
    
    if (options.cancel.is_cancelled()) {
        return cancelled("after manifest lookup");
    }
    
    const auto& endpoints = manifest.relays.empty() ? index_endpoints_ : manifest.relays;
    
    LOG_INFO("Fetching {} ({}, {} chunks) from {} endpoint(s)", manifest.file_name,
             core::utils::StringUtils::format_bytes(manifest.file_size), manifest.total_chunks, endpoints.size());
    
    std::vector<storage::ChunkRecord> chunks;
    result = collector_.collect(owner_key, content_hash, manifest.total_chunks, manifest.chunks, endpoints,
                                options.on_progress, options.cancel, chunks);
    if (!result) {
        return result;
    }
    
    if (options.cancel.is_cancelled()) {
        return cancelled("after chunk collection");
    }
    
    if (chunks.size() != manifest.total_chunks) {
        LOG_WARN("Only {} of {} chunks of {} were found", chunks.size(), manifest.total_chunks, manifest.file_name);
        return storage::FetchResult(storage::FetchError::CHUNK_COUNT_MISMATCH,
                                    "Missing chunks: got " + std::to_string(chunks.size()) + "/" +
                                    std::to_string(manifest.total_chunks));
    }
    
    std::vector<std::vector<std::uint8_t>> parts;
    result = Assembler::decode_chunks(chunks, manifest.total_chunks, manifest.encryption,
                                      manifest.encryption == storage::EncryptionMode::Sealed ? &keys : nullptr,
                                      parts);
    if (!result) {
        return result;
    }
    
    auto data = Assembler::concatenate(parts);
    
    if (options.verify_hashes) {
        result = verify(manifest, parts, data);
        if (!result) {
            return result;
        }
    }
    
    if (data.size() != manifest.file_size) {
        LOG_WARN("{} assembled to {} bytes, manifest says {}", manifest.file_name, data.size(), manifest.file_size);
    }
    
    out_file.data = std::move(data);
    out_file.mime_type = std::move(mime_type);
    out_file.file_name = manifest.file_name;
    return storage::FetchResult();
}

storage::FetchResult FileFetcher::verify(const storage::Manifest& manifest,
                                         const std::vector<std::vector<std::uint8_t>>& parts,
                                         const std::vector<std::uint8_t>& data) {
    using core::utils::StringUtils;
    
    for (std::uint32_t i = 0; i < parts.size(); ++i) {
        const auto* info = manifest.find_chunk(i);
        if (!info || info->hash.empty()) {
            continue;
        }
        
        if (crypto::hash_utils::sha256_hex(parts[i]) != StringUtils::to_lower(info->hash)) {
            return storage::FetchResult(storage::FetchError::INTEGRITY_MISMATCH,
                                        "Chunk " + std::to_string(i) + " does not match its hash");
        }
    }
    
    if (!manifest.file_hash.empty() &&
        crypto::hash_utils::sha256_hex(data) != StringUtils::to_lower(manifest.file_hash)) {
        return storage::FetchResult(storage::FetchError::INTEGRITY_MISMATCH,
                                    manifest.file_name + " does not match its content hash");
    }
    
    LOG_DEBUG("Verified {} chunk hashes and the content hash of {}", parts.size(), manifest.file_name);
    return storage::FetchResult();
}

}
