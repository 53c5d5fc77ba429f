#include "torrentcast/crypto/hash.hpp"
#include "torrentcast/core/logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace torrentcast::crypto {

bool GenericHasher::initialized_ = false;

bool GenericHasher::initialize() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (sodium_init() < 0) {
            LOG_ERROR("Failed to initialize libsodium");
            return;
        }
        initialized_ = true;
    });
    return initialized_;
}

Digest GenericHasher::hash(std::span<const std::uint8_t> data) {
    if (!initialize()) {
        throw std::runtime_error("libsodium is not available");
    }
    
    Digest result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

namespace hash_utils {

Digest hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return GenericHasher::hash(data);
}

std::string hash_to_hex(const Digest& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::string fingerprint(const std::string& text, size_t hex_chars) {
    auto hex = hash_to_hex(hash_string(text));
    return hex.substr(0, std::min(hex_chars, hex.size()));
}

}

}
