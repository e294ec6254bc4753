#include "relaysave/storage/file_index.hpp"
#include "relaysave/core/logger.hpp"
#include <nlohmann/json.hpp>

namespace relaysave::storage {

FetchResult parse_index_page(const std::string& content, FileIndexPage& out_page) {
    try {
        auto j = nlohmann::json::parse(content);
        
        int version = j.at("version").get<int>();
        if (version != SUPPORTED_PROTOCOL_VERSION) {
            return FetchResult(FetchError::UNSUPPORTED_VERSION,
                               "Unsupported index version " + std::to_string(version) +
                               ". Only version 2 is supported.");
        }
        
        FileIndexPage page;
        page.version = version;
        j.at("archive_number").get_to(page.archive_number);
        j.at("total_archives").get_to(page.total_archives);
        
        for (const auto& item : j.at("entries")) {
            FileEntry entry;
            item.at("file_hash").get_to(entry.file_hash);
            item.at("file_name").get_to(entry.file_name);
            item.at("file_size").get_to(entry.file_size);
            item.at("uploaded_at").get_to(entry.uploaded_at);
            
            auto mode = parse_encryption_mode(item.at("encryption").get<std::string>());
            if (!mode) {
                return FetchResult(FetchError::PARSE_ERROR,
                                   "Unknown encryption mode for " + entry.file_name);
            }
            entry.encryption = *mode;
            page.entries.push_back(std::move(entry));
        }
        
        out_page = std::move(page);
        return FetchResult();
    } catch (const nlohmann::json::exception& e) {
        return FetchResult(FetchError::PARSE_ERROR, std::string("Malformed index: ") + e.what());
    }
}

IndexResolver::IndexResolver(network::RecordSource& source, std::vector<std::string> endpoints)
    : source_(source), endpoints_(std::move(endpoints)) {
}

std::string IndexResolver::identifier_for_page(std::uint32_t page, std::uint32_t total_archives) {
    if (page == 0) {
        return {};
    }
    if (page == 1) {
        return CURRENT_INDEX_IDENTIFIER;
    }
    
    // page 2 is the newest archive
    std::int64_t archive_number = static_cast<std::int64_t>(total_archives) + 2 - page;
    if (archive_number < 1) {
        return {};
    }
    return ARCHIVE_IDENTIFIER_PREFIX + std::to_string(archive_number);
}

FetchResult IndexResolver::resolve(const std::string& owner_key, std::uint32_t page,
                                   FileIndexPage& out_page) {
    if (page <= 1) {
        return resolve_with_total(owner_key, page, 0, out_page);
    }
    
    FileIndexPage current;
    auto result = resolve_identifier(owner_key, CURRENT_INDEX_IDENTIFIER, current);
    if (!result) {
        return result;
    }
    
    return resolve_with_total(owner_key, page, current.total_archives, out_page);
}

FetchResult IndexResolver::resolve_with_total(const std::string& owner_key, std::uint32_t page,
                                              std::uint32_t total_archives, FileIndexPage& out_page) {
    auto identifier = identifier_for_page(page, total_archives);
    if (identifier.empty()) {
        return FetchResult(FetchError::NOT_FOUND,
                           "Page " + std::to_string(page) + " does not exist (" +
                           std::to_string(total_archives) + " archives)");
    }
    
    return resolve_identifier(owner_key, identifier, out_page);
}

FetchResult IndexResolver::resolve_identifier(const std::string& owner_key, const std::string& identifier,
                                              FileIndexPage& out_page) {
    network::RecordFilter filter;
    filter.with_kind(network::record_kind::INDEX)
          .with_author(owner_key)
          .with_tag(network::tag_name::IDENTIFIER, identifier)
          .with_limit(1);
    
    LOG_DEBUG("Resolving index {} for {}", identifier, owner_key);
    
    std::vector<network::Record> records;
    if (!source_.query(endpoints_, filter, records)) {
        LOG_WARN("Index query failed for {}", identifier);
    }
    
    const auto* newest = network::select_newest(records);
    if (!newest) {
        return FetchResult(FetchError::NOT_FOUND, "No index record " + identifier);
    }
    
    auto result = parse_index_page(newest->content, out_page);
    if (result.error == FetchError::PARSE_ERROR) {
        LOG_WARN("Failed to parse index content of {}: {}", newest->id, result.message);
        return FetchResult(FetchError::NOT_FOUND, result.message);
    }
    
    if (result) {
        LOG_DEBUG("Index {} has {} entries (archive {} of {})", identifier, out_page.entries.size(),
                  out_page.archive_number, out_page.total_archives);
    }
    return result;
}

}
