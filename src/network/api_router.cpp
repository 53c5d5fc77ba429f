#include "torrentcast/network/api_router.hpp"
#include "torrentcast/core/logger.hpp"
#include "torrentcast/core/utils.hpp"
#include "torrentcast/session/resource_locator.hpp"
#include <json/reader.h>
#include <sstream>
#include <string_view>

namespace torrentcast::network {

namespace {

using core::utils::StringUtils;
using core::utils::UrlUtils;

Json::Value file_to_json(const engine::FileEntry& file) {
    Json::Value value(Json::objectValue);
    value["name"] = file.name;
    value["path"] = file.path;
    value["length"] = Json::UInt64(file.length);
    value["size"] = StringUtils::format_bytes(file.length);
    return value;
}

Json::Value files_to_json(const std::vector<engine::FileEntry>& files) {
    Json::Value array(Json::arrayValue);
    for (const auto& file : files) {
        array.append(file_to_json(file));
    }
    return array;
}

Json::Value strings_to_json(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

std::size_t query_number(const std::string& target, const char* key, std::size_t fallback) {
    auto value = UrlUtils::query_param(target, key);
    if (!value) {
        return fallback;
    }
    auto parsed = StringUtils::parse_uint64(StringUtils::trim(*value));
    return parsed ? static_cast<std::size_t>(*parsed) : fallback;
}

}

Json::Value status_to_json(const session::SessionStatus& status) {
    Json::Value value(Json::objectValue);
    value["torrentId"] = status.session_id;
    value["infoHash"] = status.info_hash;
    value["name"] = status.name;
    value["state"] = session::session_state_name(status.state);
    value["hasMetadata"] = status.has_metadata;
    value["ready"] = status.state == session::SessionState::READY;
    value["engineReady"] = status.engine_ready;
    value["progress"] = status.progress;
    value["downloaded"] = Json::UInt64(status.received);
    value["length"] = Json::UInt64(status.total_length);
    value["numPeers"] = status.peer_count;
    value["downloadSpeed"] = Json::UInt64(status.download_rate);
    value["uploadSpeed"] = Json::UInt64(status.upload_rate);
    value["timeRemaining"] = status.time_remaining_seconds
        ? Json::Value(Json::UInt64(*status.time_remaining_seconds)) : Json::Value();
    value["videoFile"] = status.video_file ? file_to_json(*status.video_file) : Json::Value();
    value["audioFiles"] = files_to_json(status.audio_files);
    value["files"] = files_to_json(status.files);
    value["trackers"] = strings_to_json(status.trackers);
    value["error"] = status.error ? Json::Value(*status.error) : Json::Value();
    value["ageSeconds"] = Json::Int64(status.age.count());
    value["idleSeconds"] = Json::Int64(status.idle.count());
    
    const auto& diagnostic = status.diagnostic;
    Json::Value diag(Json::objectValue);
    diag["hasAnnounce"] = diagnostic.has_announce;
    diag["hasDHT"] = diagnostic.has_dht;
    diag["trackerCount"] = diagnostic.tracker_count;
    diag["dhtNodes"] = diagnostic.dht_nodes;
    diag["peersEverConnected"] = diagnostic.peers_ever_connected;
    diag["connectionStatus"] = diagnostic.connection_status;
    diag["likelyDead"] = diagnostic.likely_dead;
    diag["lastWarning"] = diagnostic.last_warning ? Json::Value(*diagnostic.last_warning) : Json::Value();
    diag["suggestions"] = strings_to_json(diagnostic.suggestions);
    value["diagnostic"] = diag;
    return value;
}

Json::Value search_to_json(const search::SearchResponse& response) {
    Json::Value value(Json::objectValue);
    value["success"] = true;
    value["query"] = response.query;
    value["page"] = Json::UInt64(response.page);
    value["limit"] = Json::UInt64(response.limit);
    value["total"] = Json::UInt64(response.total);
    
    Json::Value results(Json::arrayValue);
    for (const auto& hit : response.results) {
        Json::Value item(Json::objectValue);
        item["id"] = hit.id;
        item["name"] = hit.name;
        item["infoHash"] = hit.info_hash;
        item["size"] = hit.size;
        item["sizeBytes"] = Json::UInt64(hit.size_bytes);
        item["seeders"] = hit.seeders;
        item["leechers"] = hit.leechers;
        item["magnet"] = hit.magnet;
        item["category"] = hit.category;
        item["uploaded"] = hit.uploaded;
        results.append(item);
    }
    value["results"] = results;
    return value;
}

ApiRouter::ApiRouter(session::SessionRegistry& registry,
                     streaming::StreamGateway& gateway,
                     std::shared_ptr<search::SearchService> search,
                     std::shared_ptr<EventBroadcaster> events)
    : registry_(registry), gateway_(gateway), search_(std::move(search)), events_(std::move(events))
{
    if (events_) {
        registry_.set_ready_listener([events = events_](const session::ReadyEvent& event) {
            Json::Value data(Json::objectValue);
            data["torrentId"] = event.key;
            data["fileName"] = event.file_name;
            events->publish("torrent-ready", data);
        });
    }
}

ApiRouter::~ApiRouter() {
    if (events_) {
        registry_.set_ready_listener(nullptr);
    }
}

void ApiRouter::shutdown() {
    if (events_) {
        events_->close();
    }
}

void ApiRouter::send_error(HttpResponder& responder, http::status status,
                           const std::string& error, const std::string& message) {
    Json::Value body(Json::objectValue);
    body["error"] = error;
    if (!message.empty()) {
        body["message"] = message;
    }
    responder.send_json(status, body);
}

std::string ApiRouter::resolve_key(const std::string& id) {
    auto decoded = UrlUtils::decode(id, false);
    auto normalized = session::normalize_info_hash(decoded);
    return normalized.empty() ? decoded : normalized;
}

void ApiRouter::handle(const HttpRequest& request, HttpResponder& responder) {
    const std::string target(request.target());
    const auto path = UrlUtils::path_of(target);
    const auto method = request.method();
    
    LOG_DEBUG("{} {}", std::string(request.method_string()), path);
    
    if (method == http::verb::options) {
        responder.send_no_content();
        return;
    }
    
    if (path == "/api/stream" && method == http::verb::post) {
        start_stream(request, responder);
        return;
    }
    if (path == "/api/search" && method == http::verb::get) {
        run_search(target, responder);
        return;
    }
    if (path == "/api/health" && method == http::verb::get) {
        health(responder);
        return;
    }
    if (path == "/api/events" && method == http::verb::get && events_) {
        event_stream(responder);
        return;
    }
    
    // /api/torrent/{id}/{action}
    auto parts = StringUtils::split(path, '/');
    if (parts.size() == 5 && parts[0].empty() && parts[1] == "api" && parts[2] == "torrent" &&
        !parts[3].empty() && method == http::verb::get) {
        auto key = resolve_key(parts[3]);
        const auto& action = parts[4];
        if (action == "info") {
            torrent_info(key, responder);
            return;
        }
        if (action == "stream") {
            open_stream(key, request, streaming::StreamMode::INLINE, responder);
            return;
        }
        if (action == "download") {
            open_stream(key, request, streaming::StreamMode::ATTACHMENT, responder);
            return;
        }
    }
    
    send_error(responder, http::status::not_found, "Not found", "No route for " + path);
}

void ApiRouter::start_stream(const HttpRequest& request, HttpResponder& responder) {
    Json::CharReaderBuilder builder;
    Json::Value body;
    std::string errors;
    std::istringstream stream(request.body());
    
    if (request.body().empty() || !Json::parseFromStream(builder, stream, &body, &errors) || !body.isObject()) {
        send_error(responder, http::status::bad_request, "Magnet URL is required",
                   "Request body must be a JSON object with a magnetUrl field");
        return;
    }
    
    const auto& magnet = body["magnetUrl"];
    if (!magnet.isString() || StringUtils::trim(magnet.asString()).empty()) {
        send_error(responder, http::status::bad_request, "Magnet URL is required");
        return;
    }
    
    auto acquired = registry_.get_or_create(magnet.asString());
    if (!acquired.result.success()) {
        auto status = static_cast<http::status>(core::http_status_for(acquired.result.error));
        auto error = acquired.result.error == core::ErrorCode::INVALID_INPUT
            ? "Invalid magnet URL" : "Failed to add torrent";
        send_error(responder, status, error, acquired.result.message);
        return;
    }
    
    auto status = acquired.session->status(registry_.now());
    bool ready = status.state == session::SessionState::READY;
    
    Json::Value response(Json::objectValue);
    response["success"] = true;
    response["torrentId"] = acquired.session->key();
    response["infoHash"] = status.info_hash;
    response["state"] = session::session_state_name(status.state);
    response["ready"] = ready;
    response["created"] = acquired.created;
    if (status.video_file) {
        response["fileName"] = status.video_file->name;
    }
    response["message"] = ready ? "Torrent ready for streaming"
                        : acquired.created ? "Torrent added, waiting for metadata"
                        : "Torrent already active";
    responder.send_json(http::status::ok, response);
}

void ApiRouter::torrent_info(const std::string& key, HttpResponder& responder) {
    auto session = registry_.find(key);
    if (!session) {
        if (auto reason = registry_.tombstone(key)) {
            send_error(responder, http::status::not_found, "Torrent not found",
                       "Session was destroyed: " + *reason);
            return;
        }
        send_error(responder, http::status::not_found, "Torrent not found");
        return;
    }
    
    registry_.touch(key);
    responder.send_json(http::status::ok, status_to_json(session->status(registry_.now())));
}

void ApiRouter::open_stream(const std::string& key, const HttpRequest& request,
                            streaming::StreamMode mode, HttpResponder& responder) {
    std::optional<std::string> range;
    if (auto it = request.find(http::field::range); it != request.end()) {
        range = std::string(it->value());
    }
    
    auto outcome = gateway_.serve(key, range, mode, responder);
    LOG_DEBUG("Stream {} for {}: {}", mode == streaming::StreamMode::INLINE ? "inline" : "download",
              key.substr(0, 8), streaming::stream_outcome_name(outcome));
}

void ApiRouter::run_search(const std::string& target, HttpResponder& responder) {
    if (!search_) {
        send_error(responder, http::status::not_found, "Search is disabled");
        return;
    }
    
    auto query = UrlUtils::query_param(target, "query").value_or("");
    auto page = query_number(target, "page", 1);
    auto limit = query_number(target, "limit", 0);
    
    auto response = search_->search(query, page, limit);
    if (!response.result.success()) {
        auto status = static_cast<http::status>(core::http_status_for(response.result.error));
        auto error = response.result.error == core::ErrorCode::INVALID_INPUT
            ? "Search query is required" : "Search failed";
        send_error(responder, status, error, response.result.message);
        return;
    }
    
    responder.send_json(http::status::ok, search_to_json(response));
}

void ApiRouter::health(HttpResponder& responder) {
    Json::Value body(Json::objectValue);
    body["status"] = "ok";
    body["sessions"] = Json::UInt64(registry_.size());
    body["maxSessions"] = Json::UInt64(registry_.max_sessions());
    responder.send_json(http::status::ok, body);
}

void ApiRouter::event_stream(HttpResponder& responder) {
    auto subscription = events_->subscribe();
    if (!responder.start_event_stream()) {
        events_->unsubscribe(subscription);
        return;
    }
    
    auto send = [&responder](std::string_view frame) {
        return responder.send_body(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(frame.data()), frame.size()));
    };
    
    auto watch = responder.watch_disconnect([subscription]() { subscription->cancel(); });
    LOG_DEBUG("Event stream opened, {} subscriber(s)", events_->subscriber_count());
    
    bool open = send(": connected\n\n");
    while (open) {
        auto frame = subscription->next(EVENT_KEEPALIVE);
        if (frame) {
            open = send(*frame);
        } else if (subscription->closed()) {
            break;
        } else {
            open = send(": keepalive\n\n");
        }
    }
    
    watch.reset();
    events_->unsubscribe(subscription);
    if (open) {
        responder.finish();
    }
    LOG_DEBUG("Event stream closed");
}

}
