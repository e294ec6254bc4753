#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relaysave::core {

// Flat key=value settings. Keys are dotted ("collector.poll_interval_ms");
// the part before the first dot is the section used when saving.
class Config {
public:
    Config() = default;

    static Config& instance();

    // Lines without '=' are skipped with a warning. Returns false only when
    // the file cannot be opened.
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // Negative values clamp to min_value.
    std::chrono::milliseconds get_milliseconds(const std::string& key,
                                               std::chrono::milliseconds default_value,
                                               std::chrono::milliseconds min_value = std::chrono::milliseconds(0)) const;

    // Comma separated value, trimmed, empty items dropped.
    std::vector<std::string> get_list(const std::string& key) const;

    // Fills in every known key that is not already set.
    void set_defaults();
    void clear() { values_.clear(); }

private:
    std::map<std::string, std::string> values_;
};

}
