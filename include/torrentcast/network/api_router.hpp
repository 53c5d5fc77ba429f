#pragma once

#include "torrentcast/network/event_broadcaster.hpp"
#include "torrentcast/network/http_responder.hpp"
#include "torrentcast/search/search_service.hpp"
#include "torrentcast/session/session_registry.hpp"
#include "torrentcast/streaming/stream_gateway.hpp"
#include <json/value.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace torrentcast::network {

Json::Value status_to_json(const session::SessionStatus& status);
Json::Value search_to_json(const search::SearchResponse& response);

// Maps the /api routes onto the registry, the gateway and the search service.
// With an event broadcaster it also publishes torrent-ready on /api/events.
class ApiRouter {
public:
    static constexpr std::chrono::seconds EVENT_KEEPALIVE{15};
    
    ApiRouter(session::SessionRegistry& registry,
              streaming::StreamGateway& gateway,
              std::shared_ptr<search::SearchService> search,
              std::shared_ptr<EventBroadcaster> events = nullptr);
    ~ApiRouter();
    
    void handle(const HttpRequest& request, HttpResponder& responder);
    
    // Ends every open event stream. Call before stopping the HTTP server.
    void shutdown();
    
private:
    void start_stream(const HttpRequest& request, HttpResponder& responder);
    void torrent_info(const std::string& key, HttpResponder& responder);
    void open_stream(const std::string& key, const HttpRequest& request,
                     streaming::StreamMode mode, HttpResponder& responder);
    void run_search(const std::string& target, HttpResponder& responder);
    void health(HttpResponder& responder);
    void event_stream(HttpResponder& responder);
    
    static void send_error(HttpResponder& responder, http::status status,
                           const std::string& error, const std::string& message = "");
    static std::string resolve_key(const std::string& id);
    
    session::SessionRegistry& registry_;
    streaming::StreamGateway& gateway_;
    std::shared_ptr<search::SearchService> search_;
    std::shared_ptr<EventBroadcaster> events_;
};

}
