#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace relaysave::network {

// Published record kinds
namespace record_kind {
    constexpr std::uint32_t CHUNK = 30078;
    constexpr std::uint32_t MANIFEST = 30079;
    constexpr std::uint32_t INDEX = 30080;
}

// Tag names used for addressing
namespace tag_name {
    constexpr const char* IDENTIFIER = "d";
    constexpr const char* CONTENT_HASH = "x";
    constexpr const char* CHUNK_INDEX = "chunk";
    constexpr const char* ENCRYPTION = "encryption";
}

using Tag = std::vector<std::string>;

struct Record {
    std::string id;
    std::string author;
    std::int64_t created_at = 0;
    std::uint32_t kind = 0;
    std::vector<Tag> tags;
    std::string content;
    
    // First value of the first tag with this name.
    std::optional<std::string> tag_value(const std::string& name) const;
    bool has_tag_value(const std::string& name, const std::string& value) const;
    
    nlohmann::json to_json() const;
    // Throws nlohmann::json::exception on a malformed record.
    static Record from_json(const nlohmann::json& j);
};

// Constraints are ANDed across fields and ORed within a field. An empty
// field places no constraint.
struct RecordFilter {
    std::vector<std::uint32_t> kinds;
    std::vector<std::string> authors;
    std::vector<std::string> ids;
    std::map<std::string, std::vector<std::string>> tags;
    std::optional<size_t> limit;
    
    RecordFilter& with_kind(std::uint32_t kind);
    RecordFilter& with_author(const std::string& author);
    RecordFilter& with_tag(const std::string& name, const std::string& value);
    RecordFilter& with_ids(std::vector<std::string> record_ids);
    RecordFilter& with_limit(size_t max_records);
    
    bool matches(const Record& record) const;
    
    std::string describe() const;
};

// Of several replicas, the one with the greatest created_at wins; on a tie
// the later one in the list wins.
const Record* select_newest(const std::vector<Record>& records);

}
