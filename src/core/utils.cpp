#include "relaysave/core/utils.hpp"
#include <algorithm>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cstdlib>
#include <ctime>
#include <unordered_map>

namespace relaysave::core::utils {

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    
    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }
    
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    
    std::ostringstream oss;
    oss << parts[0];
    
    for (size_t i = 1; i < parts.size(); ++i) {
        oss << delimiter << parts[i];
    }
    
    return oss.str();
}

std::string StringUtils::trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }
    if (start == str.end()) {
        return {};
    }
    
    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));
    
    return std::string(start, end + 1);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool StringUtils::is_hex(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    
    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    
    auto minutes = seconds / 60;
    seconds %= 60;
    
    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
    
    auto hours = minutes / 60;
    minutes %= 60;
    
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

bool FileUtils::exists(const std::filesystem::path& path) {
    return std::filesystem::exists(path);
}

std::optional<std::string> FileUtils::read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    
    std::string content((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return content;
}

bool FileUtils::write_binary(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return file.good();
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (path.size() > 1 && path[0] == '~' && path[1] == '/') {
        return get_home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::string TimeUtils::format_timestamp(std::int64_t unix_seconds) {
    auto time_t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string MimeUtils::from_file_name(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
        {"mp3", "audio/mpeg"},
        {"aac", "audio/aac"},
        {"m4a", "audio/mp4"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"pdf", "application/pdf"},
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"json", "application/json"},
        {"js", "text/javascript"},
        {"ts", "text/typescript"},
        {"css", "text/css"},
        {"html", "text/html"}
    };

    auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == file_name.size()) {
        return {};
    }

    auto it = mime_types.find(StringUtils::to_lower(file_name.substr(dot + 1)));
    return it != mime_types.end() ? it->second : std::string();
}

bool MimeUtils::is_previewable(const std::string& mime_type) {
    if (mime_type.empty()) return false;
    if (mime_type.starts_with("image/")) return true;
    if (mime_type.starts_with("text/")) return true;
    if (mime_type.starts_with("video/")) return true;
    if (mime_type.starts_with("audio/")) return true;
    if (mime_type == "application/pdf") return true;
    if (mime_type == "application/json") return true;
    return mime_type.find("javascript") != std::string::npos;
}

}
