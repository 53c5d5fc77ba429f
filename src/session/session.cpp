#include "torrentcast/session/session.hpp"
#include "torrentcast/core/logger.hpp"
#include "torrentcast/session/media_types.hpp"
#include <algorithm>
#include <cmath>

namespace torrentcast::session {

Session::Session(ResourceLocator locator, TimePoint now, PiecePriorityPolicy policy,
                 std::chrono::seconds no_peer_grace)
    : locator_(std::move(locator))
    , created_at_(now)
    , policy_(policy)
    , no_peer_grace_(no_peer_grace)
    , last_accessed_at_(now)
    , engine_ready_(false)
    , announced_(false)
    , peers_ever_connected_(false)
    , last_peer_seen_at_(now)
{
}

Session::~Session() = default;

void Session::attach_handle(std::shared_ptr<engine::TransferHandle> handle) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle_ = handle;
    }
    
    if (handle) {
        auto accepted = policy_.apply_initial(*handle);
        LOG_DEBUG("Session {}: initial window pinned {} pieces", short_key(), accepted);
    }
}

void Session::set_ready_listener(ReadyListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_listener_ = std::move(listener);
}

std::shared_ptr<engine::TransferHandle> Session::handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_;
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.state();
}

TimePoint Session::last_accessed_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_accessed_at_;
}

void Session::touch(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (machine_.state() == SessionState::DESTROYED) {
        return;
    }
    last_accessed_at_ = std::max(last_accessed_at_, now);
}

std::optional<SelectedFile> Session::playable_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (machine_.state() != SessionState::READY) {
        return std::nullopt;
    }
    return machine_.selected_file();
}

std::optional<ReadinessMachine::Failed> Session::failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.failure();
}

SessionStatus Session::status(TimePoint now) const {
    SessionStatus status;
    std::shared_ptr<engine::TransferHandle> handle;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status.state = machine_.state();
        status.has_metadata = status.state == SessionState::READY ||
            (machine_.files_known() && !machine_.is_terminal());
        status.engine_ready = engine_ready_;
        status.files = machine_.files();
        status.error = machine_.error_reason();
        if (const auto& selected = machine_.selected_file()) {
            status.video_file = selected->entry;
        }
        status.diagnostic.peers_ever_connected = peers_ever_connected_;
        status.diagnostic.last_warning = last_warning_;
        status.diagnostic.has_announce = announced_;
        status.age = std::chrono::duration_cast<std::chrono::seconds>(now - created_at_);
        status.idle = std::chrono::duration_cast<std::chrono::seconds>(
            now > last_accessed_at_ ? now - last_accessed_at_ : Clock::duration::zero());
        if (status.state != SessionState::DESTROYED) {
            handle = handle_;
        }
    }
    
    status.session_id = locator_.key;
    status.info_hash = locator_.key;
    
    engine::EngineCounters counters;
    if (handle) {
        try {
            counters = handle->counters();
            status.info_hash = handle->info_hash();
        } catch (const engine::EngineError& e) {
            status.diagnostic.last_warning = std::string(e.what());
        }
    }
    
    status.name = !counters.name.empty() ? counters.name
                : !locator_.display_name.empty() ? locator_.display_name
                : "Loading...";
    status.received = counters.received;
    status.total_length = counters.total_length;
    status.progress = counters.total_length > 0
        ? std::min(1.0, static_cast<double>(counters.received) / static_cast<double>(counters.total_length))
        : 0.0;
    status.peer_count = counters.peer_count;
    status.download_rate = counters.download_rate;
    status.upload_rate = counters.upload_rate;
    
    if (counters.done) {
        status.time_remaining_seconds = 0;
    } else if (counters.download_rate > 0 && counters.total_length > 0) {
        auto remaining = static_cast<double>(counters.total_length) * (1.0 - status.progress);
        status.time_remaining_seconds = static_cast<std::uint64_t>(
            std::llround(remaining / static_cast<double>(counters.download_rate)));
    }
    
    for (const auto& file : status.files) {
        if (is_audio_file(file.name)) {
            status.audio_files.push_back(file);
        }
    }
    
    status.trackers = !counters.trackers.empty() ? counters.trackers : locator_.trackers;
    
    auto& diagnostic = status.diagnostic;
    diagnostic.tracker_count = static_cast<std::uint32_t>(status.trackers.size());
    diagnostic.has_announce = diagnostic.has_announce || !status.trackers.empty();
    diagnostic.has_dht = counters.dht_enabled;
    diagnostic.dht_nodes = counters.dht_nodes;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status.peer_count > 0) {
            last_peer_seen_at_ = std::max(last_peer_seen_at_, now);
        }
        diagnostic.likely_dead = status.peer_count == 0 && now - last_peer_seen_at_ > no_peer_grace_;
    }
    
    if (status.peer_count > 0) {
        diagnostic.connection_status = "connected";
    } else {
        diagnostic.connection_status = diagnostic.likely_dead ? "no-peers" : "searching";
        diagnostic.suggestions = {
            "No peers found - torrent might be dead (no active seeders)",
            "Try a different torrent with more seeders",
            "Check your internet connection and firewall settings",
            "Some trackers may be blocked by your network",
        };
    }
    
    return status;
}

std::shared_ptr<engine::TransferHandle> Session::mark_destroyed(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!machine_.on_destroyed(reason)) {
        return nullptr;
    }
    return std::move(handle_);
}

void Session::on_announce() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        announced_ = true;
    }
    signal_progress("tracker announce");
}

void Session::on_peer_connected() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peers_ever_connected_ = true;
    }
    signal_progress("peer connected");
}

void Session::on_metadata(const std::vector<engine::FileEntry>& files) {
    std::shared_ptr<engine::TransferHandle> handle;
    std::optional<SelectedFile> selected;
    ReadyListener listener;
    SessionState state;
    bool changed;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = machine_.on_metadata(files);
        state = machine_.state();
        handle = handle_;
        if (changed && state == SessionState::READY) {
            selected = machine_.selected_file();
            listener = ready_listener_;
        }
    }
    
    if (!changed) {
        return;
    }
    
    if (state == SessionState::READY) {
        LOG_INFO("Session {}: metadata loaded, streaming '{}' ({} bytes)",
                 short_key(), selected ? selected->entry.name : "", selected ? selected->entry.length : 0);
        if (handle) {
            policy_.apply_initial(*handle);
        }
        if (listener && selected) {
            listener(ReadyEvent{locator_.key, selected->entry.name, selected->entry.length});
        }
    } else {
        LOG_WARN("Session {}: metadata loaded with {} files but none is playable", short_key(), files.size());
    }
}

void Session::on_ready() {
    std::shared_ptr<engine::TransferHandle> handle;
    bool needs_metadata;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        engine_ready_ = true;
        needs_metadata = !machine_.files_known() && !machine_.is_terminal();
        handle = handle_;
    }
    
    LOG_INFO("Session {}: engine reports ready", short_key());
    
    if (needs_metadata && handle) {
        try {
            auto files = handle->files();
            if (!files.empty()) {
                on_metadata(files);
            }
        } catch (const engine::EngineError& e) {
            LOG_WARN("Session {}: file list unavailable after ready: {}", short_key(), e.what());
        }
    }
}

void Session::on_error(const std::string& cause, bool fatal) {
    if (!fatal) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_warning_ = cause;
        LOG_WARN("Session {}: engine warning: {}", short_key(), cause);
        return;
    }
    
    bool changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = machine_.on_fatal_error(cause);
    }
    
    if (changed) {
        LOG_ERROR("Session {}: engine error, session failed: {}", short_key(), cause);
    }
}

void Session::on_progress(std::uint64_t bytes_delta) {
    signal_progress("download");
    
    std::shared_ptr<engine::TransferHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (machine_.state() != SessionState::READY) {
            return;
        }
        handle = handle_;
    }
    
    if (handle) {
        policy_.on_progress(*handle);
    }
    LOG_TRACE("Session {}: received {} bytes", short_key(), bytes_delta);
}

void Session::signal_progress(const char* source) {
    bool changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = machine_.on_progress_signal();
    }
    
    if (changed) {
        LOG_INFO("Session {}: {} - waiting for metadata", short_key(), source);
    }
}

}
