#include "torrentcast/network/http_responder.hpp"
#include "torrentcast/core/logger.hpp"
#include "torrentcast/version.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <json/writer.h>
#include <cerrno>
#include <chrono>
#include <mutex>
#include <poll.h>
#include <sys/socket.h>

namespace torrentcast::network {

namespace {

const std::string SERVER_NAME = std::string("torrentcast/") + TORRENTCAST_VERSION_STRING;

constexpr auto DISCONNECT_POLL_INTERVAL = std::chrono::milliseconds(100);

// Hangup, error, or a zero-byte peek. Pipelined request bytes do not count.
bool peer_gone(int fd) {
    pollfd entry{};
    entry.fd = fd;
    entry.events = POLLIN | POLLRDHUP;
    if (::poll(&entry, 1, 0) <= 0) {
        return false;
    }
    if (entry.revents & (POLLERR | POLLHUP | POLLRDHUP | POLLNVAL)) {
        return true;
    }
    if (entry.revents & POLLIN) {
        char byte;
        auto received = ::recv(fd, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
        if (received == 0) {
            return true;
        }
        return received < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
    }
    return false;
}

class SocketDisconnectWatch : public streaming::DisconnectWatch {
public:
    SocketDisconnectWatch(tcp::socket& socket, std::function<void()> on_disconnect)
        : state_(std::make_shared<State>(socket.get_executor(), socket.native_handle(),
                                         std::move(on_disconnect))) {
        boost::asio::post(state_->timer.get_executor(), [state = state_]() { schedule(state); });
    }
    
    ~SocketDisconnectWatch() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->active = false;
    }
    
private:
    // Shared with the pending timer handler; the timer is only touched on the
    // io_context thread.
    struct State {
        State(tcp::socket::executor_type executor, int descriptor, std::function<void()> callback)
            : timer(std::move(executor)), fd(descriptor), on_disconnect(std::move(callback)) {}
        
        boost::asio::steady_timer timer;
        const int fd;
        std::mutex mutex;
        bool active = true;
        std::function<void()> on_disconnect;
    };
    
    static void schedule(const std::shared_ptr<State>& state) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->active) {
                return;
            }
        }
        state->timer.expires_after(DISCONNECT_POLL_INTERVAL);
        state->timer.async_wait([state](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (!state->active) {
                    return;
                }
                if (peer_gone(state->fd)) {
                    state->active = false;
                    LOG_DEBUG("Client on fd {} went away during a stream", state->fd);
                    state->on_disconnect();
                    return;
                }
            }
            schedule(state);
        });
    }
    
    std::shared_ptr<State> state_;
};

}

HttpResponder::HttpResponder(tcp::socket& socket, unsigned version, bool keep_alive)
    : socket_(socket)
    , version_(version)
    , keep_alive_(keep_alive)
    , head_sent_(false)
    , failed_(false) {}

HttpResponder::~HttpResponder() = default;

void HttpResponder::apply_cors(http::fields& fields) {
    fields.set(http::field::access_control_allow_origin, "*");
    fields.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    fields.set(http::field::access_control_allow_headers, "Content-Type, Range");
    fields.set(http::field::access_control_expose_headers,
               "Content-Length, Content-Range, Accept-Ranges, Content-Disposition");
}

std::string HttpResponder::to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

bool HttpResponder::send(HttpResponse response) {
    if (head_sent_ || failed_) {
        LOG_WARN("Response already committed, dropping {}", response.result_int());
        return false;
    }
    
    response.version(version_);
    response.set(http::field::server, SERVER_NAME);
    apply_cors(response);
    response.keep_alive(keep_alive_);
    response.prepare_payload();
    
    boost::beast::error_code ec;
    http::write(socket_, response, ec);
    head_sent_ = true;
    if (ec) {
        LOG_DEBUG("Response write failed: {}", ec.message());
        failed_ = true;
        keep_alive_ = false;
        return false;
    }
    return true;
}

bool HttpResponder::send_json(http::status status, const Json::Value& body) {
    HttpResponse response{status, version_};
    response.set(http::field::content_type, "application/json; charset=utf-8");
    response.body() = to_json_string(body);
    return send(std::move(response));
}

bool HttpResponder::send_no_content() {
    HttpResponse response{http::status::no_content, version_};
    response.set(http::field::access_control_max_age, "86400");
    return send(std::move(response));
}

bool HttpResponder::send_head(const streaming::StreamHead& head) {
    if (head_sent_ || failed_) {
        return false;
    }
    
    stream_response_ = std::make_unique<StreamResponse>(static_cast<http::status>(head.status), version_);
    auto& response = *stream_response_;
    response.set(http::field::content_type, head.content_type);
    response.set(http::field::accept_ranges, "bytes");
    if (head.content_range) {
        response.set(http::field::content_range, *head.content_range);
    }
    if (head.content_disposition) {
        response.set(http::field::content_disposition, *head.content_disposition);
    }
    if (head.no_cache) {
        response.set(http::field::cache_control, "no-cache, no-store, must-revalidate");
        response.set(http::field::pragma, "no-cache");
        response.set(http::field::expires, "0");
    }
    response.content_length(head.content_length);
    response.keep_alive(keep_alive_);
    return write_stream_head();
}

bool HttpResponder::start_event_stream() {
    if (head_sent_ || failed_) {
        return false;
    }
    
    keep_alive_ = false;
    stream_response_ = std::make_unique<StreamResponse>(http::status::ok, version_);
    auto& response = *stream_response_;
    response.set(http::field::content_type, "text/event-stream");
    response.set(http::field::cache_control, "no-cache");
    response.keep_alive(false);
    if (version_ >= 11) {
        response.chunked(true);
    }
    return write_stream_head();
}

bool HttpResponder::write_stream_head() {
    auto& response = *stream_response_;
    response.set(http::field::server, SERVER_NAME);
    apply_cors(response);
    response.body().data = nullptr;
    response.body().size = 0;
    response.body().more = true;
    
    serializer_ = std::make_unique<StreamSerializer>(response);
    
    boost::beast::error_code ec;
    http::write_header(socket_, *serializer_, ec);
    head_sent_ = true;
    if (ec) {
        LOG_DEBUG("Stream header write failed: {}", ec.message());
        failed_ = true;
        keep_alive_ = false;
        return false;
    }
    return true;
}

bool HttpResponder::send_body(std::span<const std::uint8_t> data) {
    if (!serializer_ || failed_) {
        return false;
    }
    
    auto& body = stream_response_->body();
    body.data = const_cast<std::uint8_t*>(data.data());
    body.size = data.size();
    body.more = true;
    
    boost::beast::error_code ec;
    http::write(socket_, *serializer_, ec);
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    if (ec) {
        LOG_DEBUG("Stream body write failed: {}", ec.message());
        failed_ = true;
        keep_alive_ = false;
        return false;
    }
    return true;
}

bool HttpResponder::finish() {
    if (!serializer_ || failed_) {
        return false;
    }
    
    auto& body = stream_response_->body();
    body.data = nullptr;
    body.size = 0;
    body.more = false;
    
    boost::beast::error_code ec;
    http::write(socket_, *serializer_, ec);
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    if (ec) {
        LOG_DEBUG("Stream completion write failed: {}", ec.message());
        failed_ = true;
        keep_alive_ = false;
        return false;
    }
    return true;
}

void HttpResponder::send_error(const streaming::StreamError& error) {
    HttpResponse response{static_cast<http::status>(error.status), version_};
    response.set(http::field::content_type, "application/json; charset=utf-8");
    if (error.content_range) {
        response.set(http::field::content_range, *error.content_range);
    }
    
    Json::Value body(Json::objectValue);
    body["error"] = error.error;
    body["message"] = error.message;
    body["code"] = core::error_code_name(error.code);
    response.body() = to_json_string(body);
    send(std::move(response));
}

void HttpResponder::abort() {
    failed_ = true;
    keep_alive_ = false;
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

std::unique_ptr<streaming::DisconnectWatch> HttpResponder::watch_disconnect(std::function<void()> on_disconnect) {
    if (failed_ || !socket_.is_open()) {
        return nullptr;
    }
    return std::make_unique<SocketDisconnectWatch>(socket_, std::move(on_disconnect));
}

}
