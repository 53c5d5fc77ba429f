#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace torrentcast::core {

class Config {
public:
    Config() = default;
    
    static Config& instance();
    
    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;
    
    // key=value lines, optionally grouped under [section] headers.
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    // PORT, then TORRENTCAST_<KEY> for every known key (dots become
    // underscores). Returns the number of entries overridden.
    std::size_t apply_environment(const EnvironmentLookup& lookup);
    std::size_t apply_environment();
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream iss(*value);
        T result;
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    std::vector<std::string> get_list(const std::string& key) const;
    
    void set_defaults();
    void clear() { values_.clear(); }
    
private:
    std::map<std::string, std::string> values_;
};

}
