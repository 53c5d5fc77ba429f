#pragma once

#include "torrentcast/engine/transfer_engine.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace torrentcast::session {

enum class SessionState {
    INITIALIZING,
    METADATA_LOADING,
    READY,
    ERROR,
    DESTROYED
};

const char* session_state_name(SessionState state);

enum class FailureKind {
    NO_PLAYABLE_FILE,
    ENGINE
};

struct SelectedFile {
    std::size_t index = 0;
    engine::FileEntry entry;
    std::string mime_type;
};

// Forward-only readiness state. Every transition goes through transition(),
// which rejects anything that does not move strictly forward in the order
// INITIALIZING < METADATA_LOADING < READY < ERROR < DESTROYED.
// Not synchronised; the owning Session serialises access.
class ReadinessMachine {
public:
    struct Initializing {};
    struct MetadataLoading {};
    struct Ready {
        SelectedFile file;
    };
    struct Failed {
        FailureKind kind = FailureKind::ENGINE;
        std::string reason;
    };
    struct Destroyed {
        std::string reason;
    };
    
    using StateData = std::variant<Initializing, MetadataLoading, Ready, Failed, Destroyed>;
    
    ReadinessMachine();
    
    SessionState state() const;
    bool is_terminal() const;
    
    // Peer connected, tracker announce or bytes received.
    bool on_progress_signal();
    bool on_metadata(const std::vector<engine::FileEntry>& files);
    bool on_fatal_error(const std::string& reason);
    bool on_destroyed(const std::string& reason);
    
    bool files_known() const { return files_known_; }
    const std::vector<engine::FileEntry>& files() const { return files_; }
    const std::optional<SelectedFile>& selected_file() const { return selected_; }
    std::optional<std::string> error_reason() const;
    // Set only in ERROR.
    std::optional<Failed> failure() const;
    
private:
    bool transition(StateData next);
    
    StateData data_;
    std::vector<engine::FileEntry> files_;
    bool files_known_;
    std::optional<SelectedFile> selected_;
};

}
