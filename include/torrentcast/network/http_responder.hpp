#pragma once

#include "torrentcast/streaming/stream_gateway.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <json/value.h>
#include <memory>

namespace torrentcast::network {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Writes the response(s) for one request on a connection's socket. Doubles as
// the streaming sink, driving a buffer_body serializer chunk by chunk.
class HttpResponder : public streaming::StreamSink {
public:
    HttpResponder(tcp::socket& socket, unsigned version, bool keep_alive);
    ~HttpResponder() override;
    
    HttpResponder(const HttpResponder&) = delete;
    HttpResponder& operator=(const HttpResponder&) = delete;
    
    bool send(HttpResponse response);
    bool send_json(http::status status, const Json::Value& body);
    bool send_no_content();
    
    // Opens a text/event-stream response; events then go out through
    // send_body and the stream ends with finish(). The connection closes after.
    bool start_event_stream();
    
    // streaming::StreamSink
    bool send_head(const streaming::StreamHead& head) override;
    bool send_body(std::span<const std::uint8_t> data) override;
    bool finish() override;
    void send_error(const streaming::StreamError& error) override;
    void abort() override;
    // Polls the socket from the server's io_context. A half-closed client
    // counts as gone.
    std::unique_ptr<streaming::DisconnectWatch> watch_disconnect(std::function<void()> on_disconnect) override;
    
    bool head_sent() const { return head_sent_; }
    bool keep_alive() const { return keep_alive_; }
    unsigned version() const { return version_; }
    
    static void apply_cors(http::fields& fields);
    static std::string to_json_string(const Json::Value& value);
    
private:
    using StreamResponse = http::response<http::buffer_body>;
    using StreamSerializer = http::response_serializer<http::buffer_body>;
    
    bool write_stream_head();
    
    tcp::socket& socket_;
    unsigned version_;
    bool keep_alive_;
    bool head_sent_;
    bool failed_;
    
    std::unique_ptr<StreamResponse> stream_response_;
    std::unique_ptr<StreamSerializer> serializer_;
};

}
