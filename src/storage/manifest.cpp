#include "relaysave/storage/manifest.hpp"
#include "relaysave/core/logger.hpp"
#include <nlohmann/json.hpp>

namespace relaysave::storage {

const ChunkInfo* Manifest::find_chunk(std::uint32_t index) const {
    for (const auto& chunk : chunks) {
        if (chunk.index == index) {
            return &chunk;
        }
    }
    return nullptr;
}

FetchResult parse_manifest(const std::string& content, Manifest& out_manifest) {
    try {
        auto j = nlohmann::json::parse(content);
        
        int version = j.at("version").get<int>();
        if (version != SUPPORTED_PROTOCOL_VERSION) {
            return FetchResult(FetchError::UNSUPPORTED_VERSION,
                               "Unsupported manifest version " + std::to_string(version) +
                               ". Only version 2 is supported.");
        }
        
        Manifest manifest;
        manifest.version = version;
        j.at("file_name").get_to(manifest.file_name);
        j.at("file_hash").get_to(manifest.file_hash);
        j.at("file_size").get_to(manifest.file_size);
        j.at("chunk_size").get_to(manifest.chunk_size);
        j.at("total_chunks").get_to(manifest.total_chunks);
        manifest.created_at = j.value("created_at", std::int64_t{0});
        manifest.owner_key = j.value("pubkey", std::string{});
        
        auto mode = parse_encryption_mode(j.at("encryption").get<std::string>());
        if (!mode) {
            return FetchResult(FetchError::PARSE_ERROR, "Unknown manifest encryption mode");
        }
        manifest.encryption = *mode;
        
        if (j.contains("chunks") && !j.at("chunks").is_null()) {
            for (const auto& item : j.at("chunks")) {
                ChunkInfo info;
                item.at("index").get_to(info.index);
                info.record_id = item.value("event_id", std::string{});
                info.hash = item.value("hash", std::string{});
                manifest.chunks.push_back(std::move(info));
            }
        }
        
        if (j.contains("relays") && !j.at("relays").is_null()) {
            j.at("relays").get_to(manifest.relays);
        }
        
        if (j.contains("mime_type") && j.at("mime_type").is_string()) {
            manifest.mime_type = j.at("mime_type").get<std::string>();
        }
        
        out_manifest = std::move(manifest);
        return FetchResult();
    } catch (const nlohmann::json::exception& e) {
        return FetchResult(FetchError::PARSE_ERROR, std::string("Malformed manifest: ") + e.what());
    }
}

ManifestResolver::ManifestResolver(network::RecordSource& source, std::vector<std::string> endpoints)
    : source_(source), endpoints_(std::move(endpoints)) {
}

FetchResult ManifestResolver::resolve(const std::string& owner_key, const std::string& content_hash,
                                      Manifest& out_manifest) {
    // Publishers tag manifests one way or the other; the first strategy with
    // any hit wins.
    const char* strategies[] = {network::tag_name::CONTENT_HASH, network::tag_name::IDENTIFIER};
    
    std::vector<network::Record> records;
    for (const char* tag : strategies) {
        network::RecordFilter filter;
        filter.with_kind(network::record_kind::MANIFEST)
              .with_author(owner_key)
              .with_tag(tag, content_hash)
              .with_limit(1);
        
        LOG_DEBUG("Resolving manifest {} by #{} for {}", content_hash, tag, owner_key);
        
        if (!source_.query(endpoints_, filter, records)) {
            LOG_WARN("Manifest query by #{} failed", tag);
            records.clear();
        }
        
        LOG_DEBUG("Manifest query by #{} returned {} records", tag, records.size());
        if (!records.empty()) {
            break;
        }
    }
    
    const auto* newest = network::select_newest(records);
    if (!newest) {
        return FetchResult(FetchError::NOT_FOUND, "No manifest for " + content_hash);
    }
    
    auto result = parse_manifest(newest->content, out_manifest);
    if (result.error == FetchError::PARSE_ERROR) {
        LOG_WARN("Failed to parse manifest content of {}: {}", newest->id, result.message);
        return FetchResult(FetchError::NOT_FOUND, result.message);
    }
    
    if (result) {
        LOG_DEBUG("Manifest {}: {} chunks, {} relays, encryption {}", out_manifest.file_name,
                  out_manifest.total_chunks, out_manifest.relays.size(),
                  to_wire_string(out_manifest.encryption));
    }
    return result;
}

}
