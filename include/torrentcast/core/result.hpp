#pragma once

#include <string>
#include <utility>

namespace torrentcast::core {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_INPUT,
    NOT_FOUND,
    NOT_READY,
    GONE,
    RANGE_NOT_SATISFIABLE,
    TRANSIENT_ENGINE,
    FATAL_ENGINE,
    STREAM_MID_FLIGHT,
    UPSTREAM_FAILURE
};

struct Result {
    ErrorCode error;
    std::string message;
    
    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
};

// HTTP status a failed Result maps to at the API boundary.
int http_status_for(ErrorCode error);
const char* error_code_name(ErrorCode error);

}
