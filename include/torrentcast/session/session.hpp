#pragma once

#include "torrentcast/engine/transfer_engine.hpp"
#include "torrentcast/session/piece_priority.hpp"
#include "torrentcast/session/readiness.hpp"
#include "torrentcast/session/resource_locator.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace torrentcast::session {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

struct DiagnosticInfo {
    bool has_announce = false;
    bool has_dht = false;
    std::uint32_t tracker_count = 0;
    std::uint32_t dht_nodes = 0;
    bool peers_ever_connected = false;
    std::string connection_status; // connected | searching | no-peers
    bool likely_dead = false;
    std::optional<std::string> last_warning;
    std::vector<std::string> suggestions;
};

struct SessionStatus {
    std::string session_id;
    std::string info_hash;
    std::string name;
    SessionState state = SessionState::INITIALIZING;
    bool has_metadata = false;
    bool engine_ready = false;
    double progress = 0.0;
    std::uint64_t received = 0;
    std::uint64_t total_length = 0;
    std::uint32_t peer_count = 0;
    std::uint64_t download_rate = 0;
    std::uint64_t upload_rate = 0;
    std::optional<std::uint64_t> time_remaining_seconds;
    std::optional<engine::FileEntry> video_file;
    std::vector<engine::FileEntry> audio_files;
    std::vector<engine::FileEntry> files;
    std::vector<std::string> trackers;
    std::optional<std::string> error;
    DiagnosticInfo diagnostic;
    std::chrono::seconds age{0};
    std::chrono::seconds idle{0};
};

struct ReadyEvent {
    std::string key;
    std::string file_name;
    std::uint64_t file_length = 0;
};

// Invoked once per session, outside the session lock, when it reaches READY.
using ReadyListener = std::function<void(const ReadyEvent&)>;

// One resource's lifecycle. Receives engine callbacks as a HandleObserver and
// owns the engine handle until the registry destroys it.
class Session : public engine::HandleObserver {
public:
    Session(ResourceLocator locator, TimePoint now, PiecePriorityPolicy policy,
            std::chrono::seconds no_peer_grace);
    ~Session() override;
    
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    
    void set_ready_listener(ReadyListener listener);
    
    // Binds the engine handle and pins the initial piece window.
    void attach_handle(std::shared_ptr<engine::TransferHandle> handle);
    
    const std::string& key() const { return locator_.key; }
    const ResourceLocator& locator() const { return locator_; }
    std::shared_ptr<engine::TransferHandle> handle() const;
    
    SessionState state() const;
    bool is_destroyed() const { return state() == SessionState::DESTROYED; }
    TimePoint created_at() const { return created_at_; }
    TimePoint last_accessed_at() const;
    
    // last_accessed_at never moves backwards.
    void touch(TimePoint now);
    
    // Set only while READY.
    std::optional<SelectedFile> playable_file() const;
    
    // Kind and reason of the failure while in ERROR.
    std::optional<ReadinessMachine::Failed> failure() const;
    
    SessionStatus status(TimePoint now) const;
    
    // Moves to DESTROYED and hands the engine handle back to the caller for
    // release. Returns nullptr when the session was already destroyed.
    std::shared_ptr<engine::TransferHandle> mark_destroyed(const std::string& reason);
    
    // engine::HandleObserver
    void on_announce() override;
    void on_peer_connected() override;
    void on_metadata(const std::vector<engine::FileEntry>& files) override;
    void on_ready() override;
    void on_error(const std::string& cause, bool fatal) override;
    void on_progress(std::uint64_t bytes_delta) override;
    
private:
    void signal_progress(const char* source);
    std::string short_key() const { return locator_.key.substr(0, 8); }
    
    const ResourceLocator locator_;
    const TimePoint created_at_;
    const PiecePriorityPolicy policy_;
    const std::chrono::seconds no_peer_grace_;
    
    mutable std::mutex mutex_;
    std::shared_ptr<engine::TransferHandle> handle_;
    ReadinessMachine machine_;
    TimePoint last_accessed_at_;
    bool engine_ready_;
    bool announced_;
    bool peers_ever_connected_;
    mutable TimePoint last_peer_seen_at_;
    std::optional<std::string> last_warning_;
    ReadyListener ready_listener_;
};

}
