#pragma once

#include "torrentcast/core/result.hpp"
#include <string>
#include <vector>

namespace torrentcast::session {

struct ResourceLocator {
    std::string key;          // lowercase 40-hex v1 info hash
    std::string magnet_uri;   // what the engine is given
    std::string display_name; // dn= parameter, may be empty
    std::vector<std::string> trackers;
    std::string fingerprint;  // log-safe digest of the raw input
};

// Accepts magnet URIs carrying urn:btih (hex or base32) and bare info hashes.
core::Result parse_locator(const std::string& input, ResourceLocator& out);

// Hex form of a 40-hex or 32-char base32 info hash, empty when invalid.
std::string normalize_info_hash(const std::string& text);

}
