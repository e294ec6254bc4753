#pragma once

#include "storage_types.hpp"
#include "../network/record_source.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace relaysave::storage {

struct ChunkInfo {
    std::uint32_t index = 0;
    std::string record_id;
    std::string hash;
};

struct Manifest {
    int version = 0;
    std::string file_name;
    std::string file_hash;
    std::uint64_t file_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::int64_t created_at = 0;
    std::string owner_key;
    EncryptionMode encryption = EncryptionMode::None;
    std::vector<ChunkInfo> chunks;
    std::vector<std::string> relays;
    std::optional<std::string> mime_type;
    
    const ChunkInfo* find_chunk(std::uint32_t index) const;
};

FetchResult parse_manifest(const std::string& content, Manifest& out_manifest);

// Looks a manifest up by its content tag first, then by its identifier tag.
class ManifestResolver {
public:
    ManifestResolver(network::RecordSource& source, std::vector<std::string> endpoints);
    
    FetchResult resolve(const std::string& owner_key, const std::string& content_hash,
                        Manifest& out_manifest);

private:
    network::RecordSource& source_;
    std::vector<std::string> endpoints_;
};

}
