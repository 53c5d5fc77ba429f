#pragma once

#include "torrentcast/engine/transfer_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace torrentcast::session {

bool is_playable_file(const std::string& filename);
bool is_audio_file(const std::string& filename);

// Fixed extension table; anything unknown is application/octet-stream.
std::string mime_type_for(const std::string& filename);

// First playable entry in directory order.
std::optional<std::size_t> select_playable_file(const std::vector<engine::FileEntry>& files);

// Replaces every character outside [A-Za-z0-9.-] with '_'.
std::string sanitize_filename(const std::string& filename);

}
