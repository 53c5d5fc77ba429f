#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace torrentcast::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static bool contains(const std::string& haystack, const std::string& needle);
    
    // "1.5 GB" style, two decimals dropped when trailing zeros.
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    
    static std::optional<std::uint64_t> parse_uint64(std::string_view text);
};

class UrlUtils {
public:
    // Percent-decodes and turns '+' into ' ' when decode_plus is set.
    static std::string decode(std::string_view text, bool decode_plus = true);
    static std::string encode(std::string_view text);
    
    static std::string path_of(std::string_view target);
    static std::optional<std::string> query_param(std::string_view target, std::string_view key);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    
    // Lower-cased, including the leading dot; empty when there is none.
    static std::string get_file_extension(const std::string& filename);
    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::string format_date(std::int64_t unix_seconds);
};

}
