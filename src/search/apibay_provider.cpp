#include "torrentcast/search/apibay_provider.hpp"
#include "torrentcast/core/logger.hpp"
#include "torrentcast/core/utils.hpp"
#include <curl/curl.h>
#include <json/json.h>
#include <memory>
#include <mutex>
#include <sstream>

namespace torrentcast::search {

namespace {

using core::utils::StringUtils;
using core::utils::UrlUtils;

constexpr long MAX_RESPONSE_BYTES = 8 * 1024 * 1024;

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    auto bytes = size * nmemb;
    if (body->size() + bytes > static_cast<size_t>(MAX_RESPONSE_BYTES)) {
        return 0;
    }
    body->append(ptr, bytes);
    return bytes;
}

// apibay sends every field as a string.
std::string field_string(const Json::Value& entry, const char* key) {
    const auto& value = entry[key];
    if (value.isString()) return value.asString();
    if (value.isIntegral()) return std::to_string(value.asLargestInt());
    return {};
}

template<typename T>
T field_number(const Json::Value& entry, const char* key) {
    const auto& value = entry[key];
    if (value.isUInt64()) {
        return static_cast<T>(value.asLargestUInt());
    }
    if (value.isIntegral()) {
        return T{};
    }
    if (value.isString()) {
        if (auto parsed = StringUtils::parse_uint64(StringUtils::trim(value.asString()))) {
            return static_cast<T>(*parsed);
        }
    }
    return T{};
}

}

ApibaySearchProvider::ApibaySearchProvider(SearchConfig config) : config_(std::move(config)) {
    ensure_curl_initialized();
}

std::string ApibaySearchProvider::build_url(const std::string& query, const std::string& category) const {
    auto separator = StringUtils::contains(config_.endpoint, "?") ? "&" : "?";
    return config_.endpoint + separator + "q=" + UrlUtils::encode(query) + "&cat=" + UrlUtils::encode(category);
}

CategoryResult ApibaySearchProvider::fetch(const std::string& query, const std::string& category) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return CategoryResult{core::Result(core::ErrorCode::UPSTREAM_FAILURE, "curl_easy_init failed"), {}};
    }
    
    auto url = build_url(query, category);
    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "torrentcast");
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    
    auto code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        std::string message = error_buffer[0] ? error_buffer : curl_easy_strerror(code);
        LOG_WARN("Search category {} failed: {}", category, message);
        return CategoryResult{core::Result(core::ErrorCode::UPSTREAM_FAILURE, message), {}};
    }
    
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        LOG_WARN("Search category {} returned HTTP {}", category, status);
        return CategoryResult{core::Result(core::ErrorCode::UPSTREAM_FAILURE,
                                           "Upstream returned HTTP " + std::to_string(status)), {}};
    }
    
    auto parsed = parse_response(body);
    if (!parsed.result.success()) {
        LOG_WARN("Search category {}: {}", category, parsed.result.message);
    } else {
        LOG_DEBUG("Search category {} returned {} entries", category, parsed.entries.size());
    }
    return parsed;
}

CategoryResult ApibaySearchProvider::parse_response(const std::string& body) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(body);
    
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return CategoryResult{core::Result(core::ErrorCode::UPSTREAM_FAILURE,
                                           "Malformed upstream JSON: " + errors), {}};
    }
    if (!root.isArray()) {
        return CategoryResult{core::Result(core::ErrorCode::UPSTREAM_FAILURE,
                                           "Upstream response is not a JSON array"), {}};
    }
    
    CategoryResult result;
    for (const auto& item : root) {
        if (!item.isObject()) {
            continue;
        }
        RawSearchEntry entry;
        entry.id = field_string(item, "id");
        entry.name = field_string(item, "name");
        entry.info_hash = StringUtils::to_lower(field_string(item, "info_hash"));
        entry.size = field_number<std::uint64_t>(item, "size");
        entry.seeders = field_number<std::uint32_t>(item, "seeders");
        entry.leechers = field_number<std::uint32_t>(item, "leechers");
        entry.category = field_string(item, "category");
        entry.added = field_number<std::int64_t>(item, "added");
        result.entries.push_back(std::move(entry));
    }
    return result;
}

}
