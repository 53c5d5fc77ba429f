#pragma once

#include "torrentcast/network/http_responder.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace torrentcast::core {
class Config;
}

namespace torrentcast::network {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 5000;
    std::size_t max_body_bytes = 64 * 1024;
    
    static ServerConfig from_config(const core::Config& config);
};

using RequestHandler = std::function<void(const HttpRequest&, HttpResponder&)>;

// HTTP/1.1 server. Accepts on its own io_context thread and serves each
// connection on a dedicated thread with blocking reads, so a stream waiting on
// the engine stalls only its own client.
class HttpServer {
public:
    HttpServer(ServerConfig config, RequestHandler handler);
    ~HttpServer();
    
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    
    // Throws std::runtime_error when the address cannot be bound.
    void start();
    // Waits for every connection thread. A stream blocked on engine data only
    // returns once its session is destroyed, so release sessions first.
    void stop();
    
    bool is_running() const { return running_; }
    std::uint16_t local_port() const { return local_port_; }
    std::size_t active_connections() const;
    
private:
    void do_accept();
    void handle_connection(std::shared_ptr<tcp::socket> socket);
    void release_connection(const std::shared_ptr<tcp::socket>& socket);
    
    ServerConfig config_;
    RequestHandler handler_;
    
    std::atomic<bool> running_;
    std::uint16_t local_port_;
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread server_thread_;
    
    mutable std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::set<std::shared_ptr<tcp::socket>> connections_;
};

}
