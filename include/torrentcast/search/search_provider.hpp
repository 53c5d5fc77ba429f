#pragma once

#include "torrentcast/core/result.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace torrentcast::core {
class Config;
}

namespace torrentcast::search {

struct SearchConfig {
    std::string endpoint = "https://apibay.org/q.php";
    std::vector<std::string> categories = {"200", "205", "299"};
    std::chrono::seconds timeout{15};
    std::size_t default_limit = 20;
    std::size_t max_limit = 100;
    
    static SearchConfig from_config(const core::Config& config);
};

// One upstream listing, numeric fields already parsed.
struct RawSearchEntry {
    std::string id;
    std::string name;
    std::string info_hash;
    std::uint64_t size = 0;
    std::uint32_t seeders = 0;
    std::uint32_t leechers = 0;
    std::string category;
    std::int64_t added = 0;
};

struct CategoryResult {
    core::Result result;
    std::vector<RawSearchEntry> entries;
};

class SearchProvider {
public:
    virtual ~SearchProvider() = default;
    
    virtual CategoryResult fetch(const std::string& query, const std::string& category) = 0;
};

}
