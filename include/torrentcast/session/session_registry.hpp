#pragma once

#include "torrentcast/core/result.hpp"
#include "torrentcast/engine/transfer_engine.hpp"
#include "torrentcast/session/piece_priority.hpp"
#include "torrentcast/session/session.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace torrentcast::core {
class Config;
}

namespace torrentcast::session {

struct RegistryConfig {
    std::size_t max_sessions = 3;
    std::chrono::seconds idle_timeout{30 * 60};
    std::chrono::seconds cleanup_interval{5 * 60};
    std::chrono::seconds no_peer_grace{10};
    std::size_t tombstone_limit = 64;
    
    static RegistryConfig from_config(const core::Config& config);
};

struct AcquireResult {
    core::Result result;
    std::shared_ptr<Session> session;
    bool created = false;
};

// Owns every live session, keyed by resource key. One mutex guards the table,
// the capacity check, eviction and insertion, so the number of live sessions
// never exceeds max_sessions.
class SessionRegistry {
public:
    using ClockFunction = std::function<TimePoint()>;
    
    SessionRegistry(std::shared_ptr<engine::TransferEngine> engine,
                    RegistryConfig config,
                    PiecePriorityPolicy policy = PiecePriorityPolicy(),
                    ClockFunction clock = ClockFunction());
    ~SessionRegistry();
    
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;
    
    // Handed to every session created after the call.
    void set_ready_listener(ReadyListener listener);
    
    // Reuses the live session for the locator's key, otherwise creates one,
    // evicting the least recently accessed session first when at capacity.
    AcquireResult get_or_create(const std::string& locator);
    
    std::shared_ptr<Session> find(const std::string& key) const;
    bool touch(const std::string& key);
    
    // Idempotent. Returns true when a live session was removed.
    bool destroy(const std::string& key, const std::string& reason);
    
    // Destroys sessions idle for longer than idle_timeout; returns the count.
    std::size_t sweep(TimePoint now);
    std::size_t sweep() { return sweep(now()); }
    
    // Reason a recently destroyed key went away, if it is still remembered.
    std::optional<std::string> tombstone(const std::string& key) const;
    
    std::size_t size() const;
    std::size_t max_sessions() const { return config_.max_sessions; }
    std::vector<std::string> keys() const;
    const RegistryConfig& config() const { return config_; }
    TimePoint now() const;
    
    void start_cleanup(boost::asio::io_context& io_context);
    void stop_cleanup();
    
    // Destroys every session. Further get_or_create calls still work.
    void shutdown();
    
private:
    using Released = std::pair<std::string, std::shared_ptr<engine::TransferHandle>>;
    
    Released remove_locked(const std::string& key, const std::string& reason);
    std::optional<std::string> select_victim_locked(const std::string& excluded_key) const;
    void remember_locked(const std::string& key, const std::string& reason);
    void schedule_cleanup();
    
    static void release_handle(const Released& released, const std::string& reason);
    
    std::shared_ptr<engine::TransferEngine> engine_;
    RegistryConfig config_;
    PiecePriorityPolicy policy_;
    ClockFunction clock_;
    
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::deque<std::pair<std::string, std::string>> tombstones_;
    ReadyListener ready_listener_;
    
    std::mutex timer_mutex_;
    std::unique_ptr<boost::asio::steady_timer> cleanup_timer_;
    bool cleanup_running_;
};

}
