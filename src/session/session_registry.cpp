#include "torrentcast/session/session_registry.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/logger.hpp"
#include <algorithm>
#include <tuple>

namespace torrentcast::session {

RegistryConfig RegistryConfig::from_config(const core::Config& config) {
    RegistryConfig result;
    result.max_sessions = static_cast<std::size_t>(
        std::max(1, config.get_int("sessions.max_active", static_cast<int>(result.max_sessions))));
    result.idle_timeout = std::chrono::seconds(
        config.get_int("sessions.idle_timeout_seconds", static_cast<int>(result.idle_timeout.count())));
    result.cleanup_interval = std::chrono::seconds(std::max(1,
        config.get_int("sessions.cleanup_interval_seconds", static_cast<int>(result.cleanup_interval.count()))));
    result.no_peer_grace = std::chrono::seconds(
        config.get_int("sessions.no_peer_grace_seconds", static_cast<int>(result.no_peer_grace.count())));
    return result;
}

SessionRegistry::SessionRegistry(std::shared_ptr<engine::TransferEngine> engine,
                                 RegistryConfig config,
                                 PiecePriorityPolicy policy,
                                 ClockFunction clock)
    : engine_(std::move(engine))
    , config_(config)
    , policy_(policy)
    , clock_(std::move(clock))
    , cleanup_running_(false)
{
    if (config_.max_sessions == 0) {
        config_.max_sessions = 1;
    }
    if (!clock_) {
        clock_ = []() { return Clock::now(); };
    }
    
    LOG_INFO("Session registry: max {} active sessions, idle timeout {}s, cleanup every {}s",
             config_.max_sessions, config_.idle_timeout.count(), config_.cleanup_interval.count());
}

SessionRegistry::~SessionRegistry() {
    stop_cleanup();
    shutdown();
}

TimePoint SessionRegistry::now() const {
    return clock_();
}

void SessionRegistry::set_ready_listener(ReadyListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_listener_ = std::move(listener);
}

AcquireResult SessionRegistry::get_or_create(const std::string& locator) {
    ResourceLocator parsed;
    auto parse_result = parse_locator(locator, parsed);
    if (!parse_result.success()) {
        LOG_DEBUG("Rejected locator: {}", parse_result.message);
        return AcquireResult{parse_result, nullptr, false};
    }
    
    std::vector<Released> released;
    AcquireResult result;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        
        auto it = sessions_.find(parsed.key);
        if (it != sessions_.end()) {
            if (!it->second->is_destroyed()) {
                it->second->touch(now);
                return AcquireResult{core::Result(), it->second, false};
            }
            sessions_.erase(it);
        }
        
        if (sessions_.size() >= config_.max_sessions) {
            if (auto victim = select_victim_locked(parsed.key)) {
                LOG_INFO("Capacity reached ({}), evicting least recently used session {}",
                         config_.max_sessions, *victim);
                released.push_back(remove_locked(*victim, "evicted for a new stream"));
            }
        }
        
        auto session = std::make_shared<Session>(parsed, now, policy_, config_.no_peer_grace);
        session->set_ready_listener(ready_listener_);
        
        try {
            auto handle = engine_->create(parsed.magnet_uri, session);
            if (!handle) {
                throw engine::EngineError("engine returned no handle", true);
            }
            session->attach_handle(std::move(handle));
            
            sessions_.emplace(parsed.key, session);
            tombstones_.erase(std::remove_if(tombstones_.begin(), tombstones_.end(),
                                             [&](const auto& entry) { return entry.first == parsed.key; }),
                              tombstones_.end());
            
            LOG_INFO("Session {} created (locator {}), {} of {} slots in use",
                     parsed.key, parsed.fingerprint, sessions_.size(), config_.max_sessions);
            result = AcquireResult{core::Result(), session, true};
        } catch (const engine::EngineError& e) {
            LOG_ERROR("Failed to add torrent {} (locator {}): {}", parsed.key, parsed.fingerprint, e.what());
            if (!released.empty()) {
                LOG_WARN("Session {} was evicted to make room for {}, which then failed to start; "
                         "{} of {} slots in use",
                         released.front().first, parsed.key, sessions_.size(), config_.max_sessions);
            }
            result = AcquireResult{
                core::Result(core::ErrorCode::FATAL_ENGINE, std::string("Failed to add torrent: ") + e.what()),
                nullptr, false};
        }
    }
    
    for (const auto& entry : released) {
        release_handle(entry, "evicted for a new stream");
    }
    
    return result;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end() || it->second->is_destroyed()) {
        return nullptr;
    }
    return it->second;
}

bool SessionRegistry::touch(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) {
        return false;
    }
    it->second->touch(clock_());
    return true;
}

bool SessionRegistry::destroy(const std::string& key, const std::string& reason) {
    Released released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.find(key) == sessions_.end()) {
            return false;
        }
        released = remove_locked(key, reason);
    }
    
    release_handle(released, reason);
    return true;
}

std::size_t SessionRegistry::sweep(TimePoint now) {
    std::vector<Released> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        std::vector<std::string> expired;
        for (const auto& [key, session] : sessions_) {
            if (now - session->last_accessed_at() > config_.idle_timeout) {
                expired.push_back(key);
            }
        }
        
        for (const auto& key : expired) {
            released.push_back(remove_locked(key, "idle timeout"));
        }
    }
    
    for (const auto& entry : released) {
        release_handle(entry, "idle timeout");
    }
    
    if (!released.empty()) {
        LOG_INFO("Idle sweep destroyed {} session(s)", released.size());
    }
    return released.size();
}

std::optional<std::string> SessionRegistry::tombstone(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tombstones_.rbegin(); it != tombstones_.rend(); ++it) {
        if (it->first == key) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(sessions_.size());
    for (const auto& [key, session] : sessions_) {
        result.push_back(key);
    }
    return result;
}

void SessionRegistry::start_cleanup(boost::asio::io_context& io_context) {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (cleanup_running_) {
            return;
        }
        cleanup_timer_ = std::make_unique<boost::asio::steady_timer>(io_context);
        cleanup_running_ = true;
    }
    
    LOG_INFO("Auto-cleanup enabled: sessions idle for {}s are destroyed", config_.idle_timeout.count());
    schedule_cleanup();
}

void SessionRegistry::stop_cleanup() {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    cleanup_running_ = false;
    if (cleanup_timer_) {
        cleanup_timer_->cancel();
    }
}

void SessionRegistry::shutdown() {
    std::vector<Released> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> all;
        for (const auto& [key, session] : sessions_) {
            all.push_back(key);
        }
        for (const auto& key : all) {
            released.push_back(remove_locked(key, "shutdown"));
        }
    }
    
    for (const auto& entry : released) {
        release_handle(entry, "shutdown");
    }
}

SessionRegistry::Released SessionRegistry::remove_locked(const std::string& key, const std::string& reason) {
    auto it = sessions_.find(key);
    if (it == sessions_.end()) {
        return Released{key, nullptr};
    }
    
    auto handle = it->second->mark_destroyed(reason);
    sessions_.erase(it);
    remember_locked(key, reason);
    return Released{key, std::move(handle)};
}

std::optional<std::string> SessionRegistry::select_victim_locked(const std::string& excluded_key) const {
    std::optional<std::string> victim;
    std::tuple<TimePoint, TimePoint> best;
    
    for (const auto& [key, session] : sessions_) {
        if (key == excluded_key) {
            continue;
        }
        auto candidate = std::make_tuple(session->last_accessed_at(), session->created_at());
        if (!victim || candidate < best) {
            victim = key;
            best = candidate;
        }
    }
    
    return victim;
}

void SessionRegistry::remember_locked(const std::string& key, const std::string& reason) {
    tombstones_.emplace_back(key, reason);
    while (tombstones_.size() > config_.tombstone_limit) {
        tombstones_.pop_front();
    }
}

void SessionRegistry::schedule_cleanup() {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (!cleanup_running_ || !cleanup_timer_) {
        return;
    }
    
    cleanup_timer_->expires_after(config_.cleanup_interval);
    cleanup_timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        sweep();
        schedule_cleanup();
    });
}

void SessionRegistry::release_handle(const Released& released, const std::string& reason) {
    const auto& [key, handle] = released;
    if (!handle) {
        return;
    }
    
    LOG_INFO("{}: destroying torrent {}", reason, key);
    try {
        handle->destroy([key = key](const std::string& error) {
            if (!error.empty()) {
                LOG_ERROR("Error destroying torrent {}: {}", key, error);
            } else {
                LOG_INFO("Torrent {} destroyed - memory freed", key);
            }
        });
    } catch (const engine::EngineError& e) {
        LOG_ERROR("Error destroying torrent {}: {}", key, e.what());
    }
}

}
