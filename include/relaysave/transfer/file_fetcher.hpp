#pragma once

#include "chunk_collector.hpp"
#include "assembler.hpp"
#include "../storage/manifest.hpp"
#include "../storage/chunk_cache.hpp"
#include "../network/record_source.hpp"
#include "../core/cancellation.hpp"
#include <span>
#include <string>
#include <vector>
#include <cstdint>

namespace relaysave::transfer {

struct FetchOptions {
    // Only read for sealed files; never stored.
    std::span<const std::uint8_t> secret_key;
    bool verify_hashes = false;
    ProgressCallback on_progress;
    core::CancellationToken cancel;
};

struct FetchedFile {
    std::vector<std::uint8_t> data;
    std::string mime_type;
    std::string file_name;
};

class FileFetcher {
public:
    static constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";
    
    // Manifests are looked up on index_endpoints; chunks on the manifest's
    // relays, or index_endpoints when it lists none.
    FileFetcher(network::RecordSource& source, storage::ChunkCache& cache,
                std::vector<std::string> index_endpoints,
                CollectorOptions collector_options = {});
    
    storage::FetchResult fetch(const std::string& owner_key, const std::string& content_hash,
                               const FetchOptions& options, FetchedFile& out_file);
    
    // Same pipeline for unsealed files of a previewable type.
    storage::FetchResult preview(const std::string& owner_key, const std::string& content_hash,
                                 const FetchOptions& options, FetchedFile& out_file);
    
    static std::string resolve_mime_type(const storage::Manifest& manifest);

private:
    std::vector<std::string> index_endpoints_;
    storage::ManifestResolver manifest_resolver_;
    ChunkCollector collector_;
    
    storage::FetchResult run(const std::string& owner_key, const std::string& content_hash,
                             const FetchOptions& options, bool preview_only, FetchedFile& out_file);
    
    static storage::FetchResult verify(const storage::Manifest& manifest,
                                       const std::vector<std::vector<std::uint8_t>>& parts,
                                       const std::vector<std::uint8_t>& data);
};

}
