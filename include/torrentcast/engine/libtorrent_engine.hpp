#pragma once

#include "torrentcast/engine/transfer_engine.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace torrentcast::core {
class Config;
}

namespace torrentcast::engine {

struct EngineConfig {
    int max_connections = 55;
    std::uint16_t listen_port = 6881;
    std::filesystem::path scratch_directory;
    
    static EngineConfig from_config(const core::Config& config);
};

// TransferEngine backed by a libtorrent session. Pieces are written to disk:
// each handle downloads into its own directory under scratch_directory, which
// is deleted once libtorrent confirms the torrent's removal.
std::shared_ptr<TransferEngine> make_libtorrent_engine(const EngineConfig& config);

}
