#include "torrentcast/search/search_service.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/logger.hpp"
#include "torrentcast/core/utils.hpp"
#include "torrentcast/session/resource_locator.hpp"
#include <algorithm>
#include <array>
#include <future>
#include <iterator>
#include <map>

namespace torrentcast::search {

namespace {

using core::utils::StringUtils;
using core::utils::TimeUtils;
using core::utils::UrlUtils;

const std::string PLACEHOLDER_HASH(40, '0');

constexpr std::array<const char*, 6> VIDEO_EXTENSIONS = {
    ".mp4", ".mkv", ".avi", ".webm", ".m4v", ".mov"
};

constexpr std::array<const char*, 10> QUALITY_KEYWORDS = {
    "1080p", "720p", "480p", "4k", "2160p", "hdr", "bluray", "dvdrip", "webrip", "hdtv"
};

constexpr std::uint32_t WELL_SEEDED = 5;

}

SearchConfig SearchConfig::from_config(const core::Config& config) {
    SearchConfig result;
    result.endpoint = config.get_string("search.endpoint", result.endpoint);
    auto categories = config.get_list("search.categories");
    if (!categories.empty()) {
        result.categories = categories;
    }
    result.timeout = std::chrono::seconds(
        std::max(1, config.get_int("search.timeout_seconds", static_cast<int>(result.timeout.count()))));
    return result;
}

const char* category_name(const std::string& category_id) {
    static const std::map<std::string, const char*> names = {
        {"200", "Movies"},
        {"201", "Movies DVDR"},
        {"205", "TV Shows"},
        {"207", "Movies HD"},
        {"208", "TV HD"},
        {"209", "Movies BluRay"},
        {"299", "Video"},
        {"501", "TV"},
        {"503", "TV HD"},
    };
    auto it = names.find(category_id);
    return it != names.end() ? it->second : "Video";
}

bool looks_like_video(const std::string& name, std::uint32_t seeders) {
    auto lower = StringUtils::to_lower(name);
    for (const auto* extension : VIDEO_EXTENSIONS) {
        if (StringUtils::contains(lower, extension)) return true;
    }
    for (const auto* keyword : QUALITY_KEYWORDS) {
        if (StringUtils::contains(lower, keyword)) return true;
    }
    return seeders > WELL_SEEDED;
}

SearchHit format_hit(const RawSearchEntry& entry) {
    SearchHit hit;
    hit.id = entry.id;
    hit.name = entry.name;
    hit.info_hash = entry.info_hash;
    hit.size_bytes = entry.size;
    hit.size = StringUtils::format_bytes(entry.size);
    hit.seeders = entry.seeders;
    hit.leechers = entry.leechers;
    hit.magnet = "magnet:?xt=urn:btih:" + entry.info_hash + "&dn=" + UrlUtils::encode(entry.name);
    hit.category = category_name(entry.category);
    hit.uploaded = entry.added > 0 ? TimeUtils::format_date(entry.added) : "Unknown";
    return hit;
}

SearchService::SearchService(std::shared_ptr<SearchProvider> provider, SearchConfig config)
    : provider_(std::move(provider)), config_(std::move(config)) {}

SearchResponse SearchService::search(const std::string& query, std::size_t page, std::size_t limit) {
    SearchResponse response;
    response.query = StringUtils::trim(query);
    response.page = std::max<std::size_t>(page, 1);
    response.limit = limit == 0 ? config_.default_limit : std::min(limit, config_.max_limit);
    
    if (response.query.empty()) {
        response.result = core::Result(core::ErrorCode::INVALID_INPUT, "Search query is required");
        return response;
    }
    
    std::vector<std::future<CategoryResult>> pending;
    pending.reserve(config_.categories.size());
    for (const auto& category : config_.categories) {
        pending.push_back(std::async(std::launch::async, [this, category, q = response.query]() {
            return provider_->fetch(q, category);
        }));
    }
    
    std::vector<RawSearchEntry> entries;
    std::size_t failures = 0;
    std::string last_error;
    for (auto& future : pending) {
        auto category = future.get();
        if (!category.result.success()) {
            ++failures;
            last_error = category.result.message;
            continue;
        }
        std::move(category.entries.begin(), category.entries.end(), std::back_inserter(entries));
    }
    
    if (!config_.categories.empty() && failures == config_.categories.size()) {
        LOG_ERROR("Search for '{}' failed in every category: {}", response.query, last_error);
        response.result = core::Result(core::ErrorCode::UPSTREAM_FAILURE, "Search failed: " + last_error);
        return response;
    }
    
    std::vector<SearchHit> hits;
    for (const auto& entry : entries) {
        if (entry.info_hash.empty() || entry.info_hash == PLACEHOLDER_HASH) {
            continue;
        }
        auto normalized = session::normalize_info_hash(entry.info_hash);
        if (normalized.empty() || !looks_like_video(entry.name, entry.seeders)) {
            continue;
        }
        auto hit = format_hit(entry);
        hit.info_hash = normalized;
        hit.magnet = "magnet:?xt=urn:btih:" + normalized + "&dn=" + UrlUtils::encode(entry.name);
        hits.push_back(std::move(hit));
    }
    
    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        return a.seeders > b.seeders;
    });
    
    response.total = hits.size();
    auto offset = (response.page - 1) * response.limit;
    if (offset < hits.size()) {
        auto last = std::min(hits.size(), offset + response.limit);
        response.results.assign(std::make_move_iterator(hits.begin() + offset),
                                std::make_move_iterator(hits.begin() + last));
    }
    
    LOG_INFO("Search '{}': {} matches, returning page {} ({} results)",
             response.query, response.total, response.page, response.results.size());
    return response;
}

}
