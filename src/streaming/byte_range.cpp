#include "torrentcast/streaming/byte_range.hpp"
#include "torrentcast/core/utils.hpp"
#include <algorithm>

namespace torrentcast::streaming {

namespace {

using core::utils::StringUtils;

RangeRequest not_satisfiable(std::string reason) {
    RangeRequest request;
    request.status = RangeStatus::NOT_SATISFIABLE;
    request.reason = std::move(reason);
    return request;
}

}

RangeRequest parse_range_header(std::optional<std::string_view> header, std::uint64_t length) {
    if (!header) {
        return RangeRequest{};
    }
    
    auto value = StringUtils::trim(std::string(*header));
    if (!StringUtils::starts_with(StringUtils::to_lower(value), "bytes=")) {
        return not_satisfiable("Range unit must be bytes");
    }
    
    auto first_range = value.substr(6);
    auto comma = first_range.find(',');
    if (comma != std::string::npos) {
        first_range = first_range.substr(0, comma);
    }
    first_range = StringUtils::trim(first_range);
    
    auto dash = first_range.find('-');
    if (dash == std::string::npos) {
        return not_satisfiable("Malformed range: " + value);
    }
    
    auto start_text = StringUtils::trim(first_range.substr(0, dash));
    auto end_text = StringUtils::trim(first_range.substr(dash + 1));
    
    if (length == 0) {
        return not_satisfiable("Range requested on an empty file");
    }
    
    RangeRequest request;
    request.status = RangeStatus::SATISFIABLE;
    
    if (start_text.empty()) {
        auto suffix = StringUtils::parse_uint64(end_text);
        if (!suffix || *suffix == 0) {
            return not_satisfiable("Malformed suffix range: " + value);
        }
        request.range.start = *suffix >= length ? 0 : length - *suffix;
        request.range.end = length - 1;
        return request;
    }
    
    auto start = StringUtils::parse_uint64(start_text);
    if (!start) {
        return not_satisfiable("Malformed range start: " + value);
    }
    
    std::uint64_t end = length - 1;
    if (!end_text.empty()) {
        auto parsed_end = StringUtils::parse_uint64(end_text);
        if (!parsed_end) {
            return not_satisfiable("Malformed range end: " + value);
        }
        end = std::min(*parsed_end, length - 1);
    }
    
    if (*start >= length) {
        return not_satisfiable("Range start " + std::to_string(*start) +
                               " is beyond the file length " + std::to_string(length));
    }
    if (*start > end) {
        return not_satisfiable("Range start is after range end");
    }
    
    request.range.start = *start;
    request.range.end = end;
    return request;
}

std::string content_range_header(const ByteRange& range, std::uint64_t length) {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" +
           std::to_string(length);
}

std::string unsatisfied_range_header(std::uint64_t length) {
    return "bytes */" + std::to_string(length);
}

}
