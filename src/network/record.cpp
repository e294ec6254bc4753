#include "relaysave/network/record.hpp"
#include <algorithm>
#include <sstream>

namespace relaysave::network {

std::optional<std::string> Record::tag_value(const std::string& name) const {
    for (const auto& tag : tags) {
        if (tag.size() >= 2 && tag[0] == name) {
            return tag[1];
        }
    }
    return std::nullopt;
}

bool Record::has_tag_value(const std::string& name, const std::string& value) const {
    return std::any_of(tags.begin(), tags.end(), [&](const Tag& tag) {
        return tag.size() >= 2 && tag[0] == name && tag[1] == value;
    });
}

nlohmann::json Record::to_json() const {
    return nlohmann::json{
        {"id", id},
        {"pubkey", author},
        {"created_at", created_at},
        {"kind", kind},
        {"tags", tags},
        {"content", content}
    };
}

Record Record::from_json(const nlohmann::json& j) {
    Record record;
    j.at("id").get_to(record.id);
    j.at("pubkey").get_to(record.author);
    j.at("created_at").get_to(record.created_at);
    j.at("kind").get_to(record.kind);
    j.at("content").get_to(record.content);
    if (j.contains("tags")) {
        j.at("tags").get_to(record.tags);
    }
    return record;
}

RecordFilter& RecordFilter::with_kind(std::uint32_t kind) {
    kinds.push_back(kind);
    return *this;
}

RecordFilter& RecordFilter::with_author(const std::string& author) {
    authors.push_back(author);
    return *this;
}

RecordFilter& RecordFilter::with_tag(const std::string& name, const std::string& value) {
    tags[name].push_back(value);
    return *this;
}

RecordFilter& RecordFilter::with_ids(std::vector<std::string> record_ids) {
    ids = std::move(record_ids);
    return *this;
}

RecordFilter& RecordFilter::with_limit(size_t max_records) {
    limit = max_records;
    return *this;
}

bool RecordFilter::matches(const Record& record) const {
    if (!kinds.empty() && std::find(kinds.begin(), kinds.end(), record.kind) == kinds.end()) {
        return false;
    }
    
    if (!authors.empty() && std::find(authors.begin(), authors.end(), record.author) == authors.end()) {
        return false;
    }
    
    if (!ids.empty() && std::find(ids.begin(), ids.end(), record.id) == ids.end()) {
        return false;
    }
    
    for (const auto& [name, values] : tags) {
        bool any = std::any_of(values.begin(), values.end(), [&](const std::string& value) {
            return record.has_tag_value(name, value);
        });
        if (!values.empty() && !any) {
            return false;
        }
    }
    
    return true;
}

std::string RecordFilter::describe() const {
    std::ostringstream oss;
    oss << "{kinds:" << kinds.size() << " authors:" << authors.size() << " ids:" << ids.size();
    for (const auto& [name, values] : tags) {
        oss << " #" << name << ":";
        for (const auto& value : values) {
            oss << value.substr(0, 16) << (&value != &values.back() ? "," : "");
        }
    }
    if (limit) {
        oss << " limit:" << *limit;
    }
    oss << "}";
    return oss.str();
}

const Record* select_newest(const std::vector<Record>& records) {
    const Record* newest = nullptr;
    for (const auto& record : records) {
        if (!newest || record.created_at >= newest->created_at) {
            newest = &record;
        }
    }
    return newest;
}

}
