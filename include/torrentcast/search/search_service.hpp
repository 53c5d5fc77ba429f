#pragma once

#include "torrentcast/core/result.hpp"
#include "torrentcast/search/search_provider.hpp"
#include <memory>
#include <string>
#include <vector>

namespace torrentcast::search {

struct SearchHit {
    std::string id;
    std::string name;
    std::string info_hash;
    std::string size;
    std::uint64_t size_bytes = 0;
    std::uint32_t seeders = 0;
    std::uint32_t leechers = 0;
    std::string magnet;
    std::string category;
    std::string uploaded;
};

struct SearchResponse {
    core::Result result;
    std::string query;
    std::size_t page = 1;
    std::size_t limit = 20;
    std::size_t total = 0;
    std::vector<SearchHit> results;
};

const char* category_name(const std::string& category_id);

// True for names that look like video releases or are well seeded.
bool looks_like_video(const std::string& name, std::uint32_t seeders);

SearchHit format_hit(const RawSearchEntry& entry);

// Fans a query out over the configured categories and ranks the union.
class SearchService {
public:
    SearchService(std::shared_ptr<SearchProvider> provider, SearchConfig config);
    
    // page counts from 1. limit 0 selects the configured default.
    SearchResponse search(const std::string& query, std::size_t page = 1, std::size_t limit = 0);
    
    const SearchConfig& config() const { return config_; }
    
private:
    std::shared_ptr<SearchProvider> provider_;
    SearchConfig config_;
};

}
