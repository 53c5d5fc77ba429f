#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace torrentcast::crypto {

constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// BLAKE2b via libsodium's crypto_generichash.
class GenericHasher {
public:
    static bool initialize();
    static Digest hash(std::span<const std::uint8_t> data);

private:
    static bool initialized_;
};

namespace hash_utils {

Digest hash_string(const std::string& str);
std::string hash_to_hex(const Digest& hash);

// Short stable identifier for a locator, safe to log. Magnet URIs can embed
// private tracker passkeys, so raw locators never reach the log sinks.
std::string fingerprint(const std::string& text, size_t hex_chars = 16);

}

}
