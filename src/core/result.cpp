#include "torrentcast/core/result.hpp"

namespace torrentcast::core {

int http_status_for(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return 200;
        case ErrorCode::INVALID_INPUT: return 400;
        case ErrorCode::NOT_FOUND: return 404;
        case ErrorCode::NOT_READY: return 404;
        case ErrorCode::GONE: return 410;
        case ErrorCode::RANGE_NOT_SATISFIABLE: return 416;
        case ErrorCode::UPSTREAM_FAILURE: return 502;
        case ErrorCode::TRANSIENT_ENGINE:
        case ErrorCode::FATAL_ENGINE:
        case ErrorCode::STREAM_MID_FLIGHT:
            return 500;
    }
    return 500;
}

const char* error_code_name(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::INVALID_INPUT: return "invalid_input";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::NOT_READY: return "not_ready";
        case ErrorCode::GONE: return "gone";
        case ErrorCode::RANGE_NOT_SATISFIABLE: return "range_not_satisfiable";
        case ErrorCode::TRANSIENT_ENGINE: return "transient_engine";
        case ErrorCode::FATAL_ENGINE: return "fatal_engine";
        case ErrorCode::STREAM_MID_FLIGHT: return "stream_mid_flight";
        case ErrorCode::UPSTREAM_FAILURE: return "upstream_failure";
    }
    return "unknown";
}

}
