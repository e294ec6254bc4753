#pragma once

#include "storage_types.hpp"
#include "../network/record_source.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace relaysave::storage {

struct FileEntry {
    std::string file_hash;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::int64_t uploaded_at = 0;
    EncryptionMode encryption = EncryptionMode::None;
};

struct FileIndexPage {
    int version = 0;
    std::vector<FileEntry> entries;
    std::uint32_t archive_number = 0;
    std::uint32_t total_archives = 0;
};

// UNSUPPORTED_VERSION for a well formed page of another version,
// PARSE_ERROR for anything else that does not fit.
FetchResult parse_index_page(const std::string& content, FileIndexPage& out_page);

// Resolves one page of an owner's file listing. Page 1 is the current
// listing; page N > 1 is archive (total_archives + 2 - N), which needs
// page 1 first to learn total_archives.
class IndexResolver {
public:
    static constexpr const char* CURRENT_INDEX_IDENTIFIER = "nostrsave-index";
    static constexpr const char* ARCHIVE_IDENTIFIER_PREFIX = "nostrsave-index-archive-";
    
    IndexResolver(network::RecordSource& source, std::vector<std::string> endpoints);
    
    FetchResult resolve(const std::string& owner_key, std::uint32_t page, FileIndexPage& out_page);
    
    // Archive lookup when total_archives is already known from page 1.
    FetchResult resolve_with_total(const std::string& owner_key, std::uint32_t page,
                                   std::uint32_t total_archives, FileIndexPage& out_page);
    
    // Empty for pages that cannot exist.
    static std::string identifier_for_page(std::uint32_t page, std::uint32_t total_archives);

private:
    network::RecordSource& source_;
    std::vector<std::string> endpoints_;
    
    FetchResult resolve_identifier(const std::string& owner_key, const std::string& identifier,
                                   FileIndexPage& out_page);
};

}
