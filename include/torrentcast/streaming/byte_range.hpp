#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace torrentcast::streaming {

// Inclusive byte range.
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    
    std::uint64_t length() const { return end - start + 1; }
};

enum class RangeStatus {
    NONE,
    SATISFIABLE,
    NOT_SATISFIABLE
};

struct RangeRequest {
    RangeStatus status = RangeStatus::NONE;
    ByteRange range;
    std::string reason;
};

// Parses a "Range: bytes=..." header against a resource of the given length.
// Supports start-end, start- and suffix (-n) forms; only the first range of a
// multi-range header is honoured. end is clamped to length - 1.
RangeRequest parse_range_header(std::optional<std::string_view> header, std::uint64_t length);

std::string content_range_header(const ByteRange& range, std::uint64_t length);
std::string unsatisfied_range_header(std::uint64_t length);

}
