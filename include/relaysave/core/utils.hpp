#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <optional>
#include <cstdint>

namespace relaysave::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool is_hex(const std::string& str);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::string> read_file(const std::filesystem::path& path);
    static bool write_binary(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);
    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::string format_timestamp(std::int64_t unix_seconds);
};

class MimeUtils {
public:
    // Empty when the extension is unknown.
    static std::string from_file_name(const std::string& file_name);
    static bool is_previewable(const std::string& mime_type);
};

}
