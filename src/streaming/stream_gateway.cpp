#include "torrentcast/streaming/stream_gateway.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/logger.hpp"
#include "torrentcast/session/media_types.hpp"
#include <algorithm>
#include <atomic>
#include <vector>

namespace torrentcast::streaming {

namespace {

// Closes the reader on every exit path. close() may also come from the
// disconnect watch thread; ByteReader::close is idempotent.
class ReaderGuard {
public:
    explicit ReaderGuard(std::unique_ptr<engine::ByteReader> reader) : reader_(std::move(reader)) {}
    ~ReaderGuard() { close(); }
    
    ReaderGuard(const ReaderGuard&) = delete;
    ReaderGuard& operator=(const ReaderGuard&) = delete;
    
    engine::ByteReader* operator->() const { return reader_.get(); }
    
    void close() {
        if (!reader_->is_closed()) {
            try {
                reader_->close();
            } catch (const std::exception& e) {
                LOG_WARN("Failed to close stream reader: {}", e.what());
            }
        }
    }
    
private:
    std::unique_ptr<engine::ByteReader> reader_;
};

}

GatewayConfig GatewayConfig::from_config(const core::Config& config) {
    GatewayConfig result;
    auto chunk = config.get_uint64("stream.chunk_size", result.chunk_size);
    result.chunk_size = static_cast<std::size_t>(std::clamp<std::uint64_t>(chunk, 1024, 4 * 1024 * 1024));
    return result;
}

const char* stream_outcome_name(StreamOutcome outcome) {
    switch (outcome) {
        case StreamOutcome::COMPLETED: return "completed";
        case StreamOutcome::REJECTED: return "rejected";
        case StreamOutcome::CLIENT_DISCONNECTED: return "client_disconnected";
        case StreamOutcome::FAILED_BEFORE_HEADERS: return "failed_before_headers";
        case StreamOutcome::ABORTED_MID_STREAM: return "aborted_mid_stream";
    }
    return "unknown";
}

StreamGateway::StreamGateway(session::SessionRegistry& registry, GatewayConfig config)
    : registry_(registry), config_(config) {}

OpenedStream StreamGateway::reject(core::ErrorCode code, std::string error, std::string message) {
    OpenedStream stream;
    stream.result = core::Result(code, message);
    stream.error.status = core::http_status_for(code);
    stream.error.code = code;
    stream.error.error = std::move(error);
    stream.error.message = std::move(message);
    return stream;
}

OpenedStream StreamGateway::open_range_stream(const std::string& key,
                                              const std::optional<std::string>& range_header,
                                              StreamMode mode) {
    auto session = registry_.find(key);
    if (!session) {
        if (auto reason = registry_.tombstone(key)) {
            return reject(core::ErrorCode::GONE, "Torrent has been destroyed",
                          "Session was destroyed: " + *reason);
        }
        return reject(core::ErrorCode::NOT_FOUND, "Torrent not found",
                      "No active session for " + key);
    }
    
    registry_.touch(key);
    
    switch (session->state()) {
        case session::SessionState::DESTROYED:
            return reject(core::ErrorCode::GONE, "Torrent has been destroyed",
                          "Session was destroyed while the request was in flight");
        case session::SessionState::ERROR: {
            auto failure = session->failure();
            auto reason = failure ? failure->reason : std::string("Session is in the error state");
            if (failure && failure->kind == session::FailureKind::NO_PLAYABLE_FILE) {
                return reject(core::ErrorCode::NOT_FOUND, "No video file found in torrent", reason);
            }
            return reject(core::ErrorCode::FATAL_ENGINE, "Torrent failed", reason);
        }
        case session::SessionState::INITIALIZING:
        case session::SessionState::METADATA_LOADING:
            return reject(core::ErrorCode::NOT_READY, "Torrent not ready",
                          "Metadata is still loading; poll the info endpoint until ready");
        case session::SessionState::READY:
            break;
    }
    
    auto selected = session->playable_file();
    if (!selected) {
        return reject(core::ErrorCode::NOT_READY, "Torrent not ready", "No file selected yet");
    }
    
    auto length = selected->entry.length;
    auto request = parse_range_header(range_header, length);
    if (request.status == RangeStatus::NOT_SATISFIABLE) {
        auto stream = reject(core::ErrorCode::RANGE_NOT_SATISFIABLE, "Range not satisfiable", request.reason);
        stream.error.content_range = unsatisfied_range_header(length);
        return stream;
    }
    
    OpenedStream stream;
    stream.session = session;
    stream.file_index = selected->index;
    stream.file_name = selected->entry.name;
    stream.file_length = length;
    
    if (request.status == RangeStatus::SATISFIABLE) {
        stream.range = request.range;
        stream.head.status = 206;
        stream.head.content_range = content_range_header(request.range, length);
        stream.head.content_length = request.range.length();
    } else {
        stream.range = ByteRange{0, length == 0 ? 0 : length - 1};
        stream.head.status = 200;
        stream.head.content_length = length;
    }
    
    if (mode == StreamMode::INLINE) {
        stream.head.content_type = selected->mime_type;
        stream.head.no_cache = true;
    } else {
        stream.head.content_type = "application/octet-stream";
        stream.head.content_disposition =
            "attachment; filename=\"" + session::sanitize_filename(selected->entry.name) + "\"";
    }
    
    LOG_DEBUG("Opening {} stream for {} [{}] {} bytes",
              mode == StreamMode::INLINE ? "inline" : "attachment",
              key.substr(0, 8), stream.head.content_range.value_or("full"), stream.head.content_length);
    return stream;
}

StreamOutcome StreamGateway::pump(OpenedStream& stream, StreamSink& sink) {
    auto& session = stream.session;
    const auto key = session->key();
    
    auto fail_early = [&](const std::string& message) {
        StreamError error;
        error.status = 500;
        error.code = core::ErrorCode::FATAL_ENGINE;
        error.error = "Stream error";
        error.message = message;
        sink.send_error(error);
        registry_.touch(key);
        return StreamOutcome::FAILED_BEFORE_HEADERS;
    };
    
    if (stream.head.content_length == 0) {
        if (!sink.send_head(stream.head) || !sink.finish()) {
            return StreamOutcome::CLIENT_DISCONNECTED;
        }
        return StreamOutcome::COMPLETED;
    }
    
    auto handle = session->handle();
    if (!handle || session->is_destroyed()) {
        return fail_early("Session was destroyed before the stream started");
    }
    
    std::unique_ptr<engine::ByteReader> raw_reader;
    try {
        raw_reader = handle->open_file_reader(stream.file_index, stream.range.start, stream.range.end);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to open reader for {}: {}", key.substr(0, 8), e.what());
        return fail_early(std::string("Failed to create stream: ") + e.what());
    }
    if (!raw_reader) {
        return fail_early("Failed to create stream");
    }
    ReaderGuard reader(std::move(raw_reader));
    
    std::atomic<bool> client_gone(false);
    auto watch = sink.watch_disconnect([&reader, &client_gone]() {
        client_gone = true;
        reader.close();
    });
    
    std::vector<std::uint8_t> buffer(config_.chunk_size);
    std::uint64_t remaining = stream.head.content_length;
    std::uint64_t sent = 0;
    bool head_sent = false;
    
    while (remaining > 0) {
        std::size_t count = 0;
        try {
            if (session->is_destroyed()) {
                throw engine::EngineError("session destroyed during stream");
            }
            auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
            count = reader->read(std::span<std::uint8_t>(buffer.data(), want));
            if (count == 0) {
                throw engine::EngineError("reader ended after " + std::to_string(sent) + " of " +
                                          std::to_string(stream.head.content_length) + " bytes");
            }
        } catch (const std::exception& e) {
            registry_.touch(key);
            if (client_gone) {
                LOG_DEBUG("Client left stream {} while waiting for data after {} bytes", key.substr(0, 8), sent);
                sink.abort();
                return StreamOutcome::CLIENT_DISCONNECTED;
            }
            if (!head_sent) {
                LOG_ERROR("Stream for {} failed before headers: {}", key.substr(0, 8), e.what());
                reader.close();
                return fail_early(e.what());
            }
            LOG_WARN("Stream for {} aborted after {} bytes: {}", key.substr(0, 8), sent, e.what());
            reader.close();
            sink.abort();
            return StreamOutcome::ABORTED_MID_STREAM;
        }
        
        if (!head_sent) {
            if (!sink.send_head(stream.head)) {
                reader.close();
                registry_.touch(key);
                return StreamOutcome::CLIENT_DISCONNECTED;
            }
            head_sent = true;
        }
        
        if (!sink.send_body(std::span<const std::uint8_t>(buffer.data(), count))) {
            LOG_DEBUG("Client left stream {} after {} bytes", key.substr(0, 8), sent);
            reader.close();
            registry_.touch(key);
            return StreamOutcome::CLIENT_DISCONNECTED;
        }
        
        sent += count;
        remaining -= count;
        registry_.touch(key);
    }
    
    reader.close();
    registry_.touch(key);
    if (!sink.finish()) {
        return StreamOutcome::CLIENT_DISCONNECTED;
    }
    LOG_DEBUG("Stream for {} completed, {} bytes", key.substr(0, 8), sent);
    return StreamOutcome::COMPLETED;
}

StreamOutcome StreamGateway::serve(const std::string& key,
                                   const std::optional<std::string>& range_header,
                                   StreamMode mode,
                                   StreamSink& sink) {
    auto stream = open_range_stream(key, range_header, mode);
    if (!stream.result.success()) {
        sink.send_error(stream.error);
        return StreamOutcome::REJECTED;
    }
    return pump(stream, sink);
}

}
