#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace coffer::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string trim_right(const std::string& str, char ch);
    static std::string to_lower(const std::string& str);
    static bool is_alphanumeric(const std::string& str);
    static std::string format_bytes(std::uint64_t bytes);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();
};

class TimeUtils {
public:
    static std::int64_t unix_seconds();
    static std::string to_http_date(const std::chrono::system_clock::time_point& time);
    static std::string format_timestamp(std::int64_t unix_seconds);
};

} // namespace coffer::core::utils
