#include "torrentcast/session/resource_locator.hpp"
#include "torrentcast/core/utils.hpp"
#include "torrentcast/crypto/hash.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace torrentcast::session {

namespace {

using core::utils::StringUtils;
using core::utils::UrlUtils;

constexpr size_t HEX_HASH_LENGTH = 40;
constexpr size_t BASE32_HASH_LENGTH = 32;

bool is_hex(const std::string& text) {
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string base32_to_hex(const std::string& text) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char raw : text) {
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
        int value;
        if (c >= 'A' && c <= 'Z') {
            value = c - 'A';
        } else if (c >= '2' && c <= '7') {
            value = c - '2' + 26;
        } else {
            return "";
        }
        
        buffer = (buffer << 5) | static_cast<std::uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            oss << std::setw(2) << ((buffer >> bits) & 0xFF);
        }
    }
    
    return oss.str();
}

}

std::string normalize_info_hash(const std::string& text) {
    if (text.size() == HEX_HASH_LENGTH && is_hex(text)) {
        return StringUtils::to_lower(text);
    }
    if (text.size() == BASE32_HASH_LENGTH) {
        auto hex = base32_to_hex(text);
        if (hex.size() == HEX_HASH_LENGTH) {
            return hex;
        }
    }
    return "";
}

core::Result parse_locator(const std::string& input, ResourceLocator& out) {
    auto locator = StringUtils::trim(input);
    if (locator.empty()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Magnet URL is required");
    }
    
    ResourceLocator parsed;
    parsed.fingerprint = crypto::hash_utils::fingerprint(locator);
    
    if (!StringUtils::starts_with(StringUtils::to_lower(locator), "magnet:?")) {
        parsed.key = normalize_info_hash(locator);
        if (parsed.key.empty()) {
            return core::Result(core::ErrorCode::INVALID_INPUT,
                                "Unsupported locator: expected a magnet URI or a 40-character info hash");
        }
        parsed.magnet_uri = "magnet:?xt=urn:btih:" + parsed.key;
        out = std::move(parsed);
        return core::Result();
    }
    
    for (const auto& param : StringUtils::split(locator.substr(8), '&')) {
        auto eq = param.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        auto name = StringUtils::to_lower(param.substr(0, eq));
        auto value = UrlUtils::decode(param.substr(eq + 1), false);
        
        if (name == "xt" && parsed.key.empty()) {
            auto lower = StringUtils::to_lower(value);
            if (StringUtils::starts_with(lower, "urn:btih:")) {
                parsed.key = normalize_info_hash(value.substr(9));
                if (parsed.key.empty()) {
                    return core::Result(core::ErrorCode::INVALID_INPUT,
                                        "Magnet URL carries a malformed info hash");
                }
            }
        } else if (name == "dn") {
            parsed.display_name = UrlUtils::decode(param.substr(eq + 1), true);
        } else if (name == "tr") {
            parsed.trackers.push_back(value);
        }
    }
    
    if (parsed.key.empty()) {
        return core::Result(core::ErrorCode::INVALID_INPUT,
                            "Magnet URL has no urn:btih exact topic");
    }
    
    parsed.magnet_uri = locator;
    out = std::move(parsed);
    return core::Result();
}

}
