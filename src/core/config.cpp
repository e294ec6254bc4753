#include "relaysave/core/config.hpp"
#include "relaysave/core/logger.hpp"
#include "relaysave/core/utils.hpp"
#include <algorithm>
#include <charconv>
#include <fstream>

namespace relaysave::core {

namespace {

struct DefaultSetting {
    const char* key;
    const char* value;
};

constexpr DefaultSetting DEFAULTS[] = {
    {"log.level", "info"},
    {"log.file", "relaysave.log"},
    {"store.path", "relaysave.db"},
    {"relays.default", "wss://nos.lol,wss://relay.nostr.net,wss://relay.primal.net,wss://relay.snort.social"},
    {"collector.poll_interval_ms", "100"},
    {"collector.inactivity_timeout_ms", "5000"},
    {"collector.max_duration_ms", "300000"},
    {"collector.id_batch_size", "200"},
    {"fetch.verify_hashes", "false"},
};

std::string section_of(const std::string& key) {
    auto dot = key.find('.');
    return dot == std::string::npos ? std::string() : key.substr(0, dot);
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        auto key = eq_pos == std::string::npos ? std::string() : utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key=value, line ignored", filename, line_number);
            continue;
        }

        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }

    LOG_DEBUG("Loaded {} settings from {}", values_.size(), filename);
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# relaysave configuration\n";

    std::string current_section;
    bool first = true;
    for (const auto& [key, value] : values_) {
        auto section = section_of(key);
        if (first || section != current_section) {
            file << "\n";
            if (!section.empty()) {
                file << "# " << section << "\n";
            }
            current_section = section;
            first = false;
        }
        file << key << "=" << value << "\n";
    }

    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    if (!value || value->empty()) return default_value;

    int result = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
    if (ec != std::errc() || ptr != value->data() + value->size()) {
        LOG_WARN("Setting {}={} is not an integer, using {}", key, *value, default_value);
        return default_value;
    }
    return result;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::chrono::milliseconds Config::get_milliseconds(const std::string& key,
                                                   std::chrono::milliseconds default_value,
                                                   std::chrono::milliseconds min_value) const {
    auto millis = get_int(key, static_cast<int>(default_value.count()));
    return std::max(std::chrono::milliseconds(millis), min_value);
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> items;
    auto value = get(key);
    if (!value) return items;

    for (const auto& part : utils::StringUtils::split(*value, ',')) {
        auto item = utils::StringUtils::trim(part);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
    }
    return items;
}

void Config::set_defaults() {
    for (const auto& setting : DEFAULTS) {
        values_.emplace(setting.key, setting.value);
    }
}

}
