#include "torrentcast/network/http_server.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/logger.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <stdexcept>

namespace torrentcast::network {

ServerConfig ServerConfig::from_config(const core::Config& config) {
    ServerConfig result;
    result.bind_address = config.get_string("server.bind_address", result.bind_address);
    auto port = config.get_int("server.port", result.port);
    if (port < 0 || port > 65535) {
        throw std::runtime_error("server.port out of range: " + std::to_string(port));
    }
    result.port = static_cast<std::uint16_t>(port);
    return result;
}

HttpServer::HttpServer(ServerConfig config, RequestHandler handler)
    : config_(std::move(config))
    , handler_(std::move(handler))
    , running_(false)
    , local_port_(0)
    , io_context_()
    , acceptor_(io_context_) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) {
        LOG_WARN("HTTP server already running");
        return;
    }
    
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        throw std::runtime_error("Invalid bind address '" + config_.bind_address + "': " + ec.message());
    }
    
    tcp::endpoint endpoint(address, config_.port);
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) {
        acceptor_.close();
        throw std::runtime_error("Failed to bind " + config_.bind_address + ":" +
                                 std::to_string(config_.port) + ": " + ec.message());
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        acceptor_.close();
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
    
    local_port_ = acceptor_.local_endpoint().port();
    running_ = true;
    io_context_.restart();
    do_accept();
    
    server_thread_ = std::thread([this]() {
        LOG_INFO("HTTP server listening on {}:{}", config_.bind_address, local_port_);
        
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("IO context error: {}", e.what());
                if (!running_) break;
                
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }
        
        LOG_INFO("HTTP server stopped");
    });
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    LOG_INFO("Stopping HTTP server on port {}", local_port_);
    
    boost::system::error_code close_ec;
    acceptor_.close(close_ec);
    
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& socket : connections_) {
            boost::system::error_code ec;
            socket->shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    
    io_context_.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    
    std::unique_lock<std::mutex> lock(connections_mutex_);
    connections_cv_.wait(lock, [this]() { return connections_.empty(); });
}

std::size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void HttpServer::do_accept() {
    if (!running_) {
        return;
    }
    
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                auto connection = std::make_shared<tcp::socket>(std::move(socket));
                {
                    std::lock_guard<std::mutex> lock(connections_mutex_);
                    connections_.insert(connection);
                }
                std::thread(&HttpServer::handle_connection, this, connection).detach();
                
                do_accept();
            } else if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("Accept error: {}", ec.message());
                
                if (running_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    do_accept();
                }
            }
        });
}

void HttpServer::handle_connection(std::shared_ptr<tcp::socket> socket) {
    boost::system::error_code endpoint_ec;
    auto remote = socket->remote_endpoint(endpoint_ec);
    LOG_DEBUG("Connection from {}:{}", remote.address().to_string(), remote.port());
    
    boost::beast::flat_buffer buffer;
    while (running_) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(config_.max_body_bytes);
        
        boost::beast::error_code ec;
        http::read(*socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec) {
            LOG_DEBUG("HTTP read ended: {}", ec.message());
            break;
        }
        
        auto request = parser.release();
        HttpResponder responder(*socket, request.version(), request.keep_alive());
        
        try {
            handler_(request, responder);
        } catch (const std::exception& e) {
            LOG_ERROR("Unhandled error serving {}: {}", std::string(request.target()), e.what());
            if (!responder.head_sent()) {
                Json::Value body(Json::objectValue);
                body["error"] = "Internal server error";
                body["message"] = e.what();
                responder.send_json(http::status::internal_server_error, body);
            }
            break;
        }
        
        if (!responder.head_sent() || !responder.keep_alive()) {
            break;
        }
    }
    
    boost::system::error_code ec;
    socket->shutdown(tcp::socket::shutdown_send, ec);
    socket->close(ec);
    release_connection(socket);
}

void HttpServer::release_connection(const std::shared_ptr<tcp::socket>& socket) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(socket);
    connections_cv_.notify_all();
}

}
