#pragma once

#include "torrentcast/engine/transfer_engine.hpp"
#include <cstdint>

namespace torrentcast::core {
class Config;
}

namespace torrentcast::session {

struct PriorityConfig {
    std::uint32_t buffer_ahead = 20;
    std::uint32_t initial_window = 100;
    
    static PriorityConfig from_config(const core::Config& config);
};

struct PieceWindow {
    std::uint32_t first = 0;
    std::uint32_t last = 0; // exclusive
    
    std::uint32_t size() const { return last > first ? last - first : 0; }
};

// Keeps the engine fetching in playback order. All calls are advisory:
// pieces the engine cannot resolve are skipped, never reported.
class PiecePriorityPolicy {
public:
    explicit PiecePriorityPolicy(PriorityConfig config = {});
    
    // [floor(progress * piece_count), + buffer_ahead) clamped to the piece range.
    PieceWindow playback_window(double progress, std::uint32_t piece_count) const;
    PieceWindow initial_window(std::uint32_t piece_count) const;
    
    // Returns the number of pieces the engine accepted.
    std::uint32_t apply_initial(engine::TransferHandle& handle) const;
    std::uint32_t on_progress(engine::TransferHandle& handle) const;
    
    const PriorityConfig& config() const { return config_; }
    
private:
    std::uint32_t raise(engine::TransferHandle& handle, PieceWindow window) const;
    
    PriorityConfig config_;
};

}
