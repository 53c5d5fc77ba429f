#pragma once

#include "torrentcast/core/result.hpp"
#include "torrentcast/session/session_registry.hpp"
#include "torrentcast/streaming/byte_range.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace torrentcast::core {
class Config;
}

namespace torrentcast::streaming {

struct GatewayConfig {
    std::size_t chunk_size = 64 * 1024;
    
    static GatewayConfig from_config(const core::Config& config);
};

enum class StreamMode {
    INLINE,     // /stream: file MIME type, no-cache
    ATTACHMENT  // /download: octet-stream, Content-Disposition
};

struct StreamHead {
    int status = 200;
    std::string content_type;
    std::uint64_t content_length = 0;
    std::optional<std::string> content_range;
    std::optional<std::string> content_disposition;
    bool no_cache = false;
};

struct StreamError {
    int status = 500;
    core::ErrorCode code = core::ErrorCode::FATAL_ENGINE;
    std::string error;
    std::string message;
    std::optional<std::string> content_range;
};

struct OpenedStream {
    core::Result result;
    std::shared_ptr<session::Session> session;
    std::size_t file_index = 0;
    std::string file_name;
    std::uint64_t file_length = 0;
    ByteRange range;
    StreamHead head;
    StreamError error;
};

// Cancels a disconnect watch when destroyed. Once the destructor returns the
// callback is neither running nor going to run.
class DisconnectWatch {
public:
    virtual ~DisconnectWatch() = default;
};

// Transport side of a stream. send_* return false once the client is gone.
class StreamSink {
public:
    virtual ~StreamSink() = default;
    
    virtual bool send_head(const StreamHead& head) = 0;
    virtual bool send_body(std::span<const std::uint8_t> data) = 0;
    virtual bool finish() = 0;
    virtual void send_error(const StreamError& error) = 0;
    // Drops the connection without completing the response.
    virtual void abort() = 0;
    
    // Runs on_disconnect on another thread if the client goes away while no
    // send_* call is in progress. nullptr when the transport cannot tell.
    virtual std::unique_ptr<DisconnectWatch> watch_disconnect(std::function<void()> on_disconnect) {
        (void)on_disconnect;
        return nullptr;
    }
};

enum class StreamOutcome {
    COMPLETED,
    REJECTED,
    CLIENT_DISCONNECTED,
    FAILED_BEFORE_HEADERS,
    ABORTED_MID_STREAM
};

const char* stream_outcome_name(StreamOutcome outcome);

// Serves byte ranges of a session's selected file. Headers are committed only
// after the first chunk has been read, so an early engine failure still yields
// a clean error response. Every exit path closes the reader exactly once, and a
// client that leaves while a read is blocked closes it from the sink's watch.
class StreamGateway {
public:
    StreamGateway(session::SessionRegistry& registry, GatewayConfig config = GatewayConfig());
    
    // Resolves the session, file and range, and plans the response head.
    OpenedStream open_range_stream(const std::string& key,
                                   const std::optional<std::string>& range_header,
                                   StreamMode mode);
    
    StreamOutcome pump(OpenedStream& stream, StreamSink& sink);
    
    // open_range_stream followed by pump, or the rejection on the sink.
    StreamOutcome serve(const std::string& key,
                        const std::optional<std::string>& range_header,
                        StreamMode mode,
                        StreamSink& sink);
    
    const GatewayConfig& config() const { return config_; }
    
private:
    OpenedStream reject(core::ErrorCode code, std::string error, std::string message);
    
    session::SessionRegistry& registry_;
    GatewayConfig config_;
};

}
