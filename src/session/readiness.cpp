#include "torrentcast/session/readiness.hpp"
#include "torrentcast/session/media_types.hpp"

namespace torrentcast::session {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::INITIALIZING: return "initializing";
        case SessionState::METADATA_LOADING: return "metadata_loading";
        case SessionState::READY: return "ready";
        case SessionState::ERROR: return "error";
        case SessionState::DESTROYED: return "destroyed";
    }
    return "unknown";
}

ReadinessMachine::ReadinessMachine()
    : data_(Initializing{})
    , files_known_(false)
{
}

SessionState ReadinessMachine::state() const {
    // Variant alternatives are declared in SessionState order.
    return static_cast<SessionState>(data_.index());
}

bool ReadinessMachine::is_terminal() const {
    auto current = state();
    return current == SessionState::ERROR || current == SessionState::DESTROYED;
}

bool ReadinessMachine::on_progress_signal() {
    if (state() != SessionState::INITIALIZING) {
        return false;
    }
    return transition(MetadataLoading{});
}

bool ReadinessMachine::on_metadata(const std::vector<engine::FileEntry>& files) {
    auto current = state();
    if (current != SessionState::INITIALIZING && current != SessionState::METADATA_LOADING) {
        return false;
    }
    
    files_ = files;
    files_known_ = true;
    
    auto index = select_playable_file(files_);
    if (!index) {
        return transition(Failed{FailureKind::NO_PLAYABLE_FILE, "No playable video file (.mp4, .mkv, .avi, .webm) in this torrent"});
    }
    
    SelectedFile selected{*index, files_[*index], mime_type_for(files_[*index].name)};
    selected_ = selected;
    return transition(Ready{std::move(selected)});
}

bool ReadinessMachine::on_fatal_error(const std::string& reason) {
    return transition(Failed{FailureKind::ENGINE, reason});
}

bool ReadinessMachine::on_destroyed(const std::string& reason) {
    return transition(Destroyed{reason});
}

std::optional<std::string> ReadinessMachine::error_reason() const {
    if (auto failed = std::get_if<Failed>(&data_)) {
        return failed->reason;
    }
    if (auto destroyed = std::get_if<Destroyed>(&data_)) {
        return destroyed->reason;
    }
    return std::nullopt;
}

std::optional<ReadinessMachine::Failed> ReadinessMachine::failure() const {
    if (auto failed = std::get_if<Failed>(&data_)) {
        return *failed;
    }
    return std::nullopt;
}

bool ReadinessMachine::transition(StateData next) {
    if (next.index() <= data_.index()) {
        return false;
    }
    data_ = std::move(next);
    return true;
}

}
