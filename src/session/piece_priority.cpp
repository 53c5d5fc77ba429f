#include "torrentcast/session/piece_priority.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace torrentcast::session {

PriorityConfig PriorityConfig::from_config(const core::Config& config) {
    PriorityConfig result;
    result.buffer_ahead = static_cast<std::uint32_t>(
        std::max(1, config.get_int("priority.buffer_ahead", static_cast<int>(result.buffer_ahead))));
    result.initial_window = static_cast<std::uint32_t>(
        std::max(1, config.get_int("priority.initial_window", static_cast<int>(result.initial_window))));
    return result;
}

PiecePriorityPolicy::PiecePriorityPolicy(PriorityConfig config)
    : config_(config)
{
}

PieceWindow PiecePriorityPolicy::playback_window(double progress, std::uint32_t piece_count) const {
    PieceWindow window;
    if (piece_count == 0 || !std::isfinite(progress)) {
        return window;
    }
    
    progress = std::clamp(progress, 0.0, 1.0);
    auto current = static_cast<std::uint64_t>(std::floor(progress * piece_count));
    current = std::min<std::uint64_t>(current, piece_count);
    
    window.first = static_cast<std::uint32_t>(current);
    window.last = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(current + config_.buffer_ahead, piece_count));
    return window;
}

PieceWindow PiecePriorityPolicy::initial_window(std::uint32_t piece_count) const {
    // Unknown piece count still yields the nominal window; the engine skips
    // what it cannot resolve.
    PieceWindow window;
    window.first = 0;
    window.last = piece_count == 0 ? config_.initial_window
                                   : std::min(config_.initial_window, piece_count);
    return window;
}

std::uint32_t PiecePriorityPolicy::apply_initial(engine::TransferHandle& handle) const {
    std::uint32_t piece_count = 0;
    try {
        piece_count = handle.counters().piece_count;
    } catch (const engine::EngineError& e) {
        LOG_DEBUG("Piece count unavailable for initial window: {}", e.what());
    }
    return raise(handle, initial_window(piece_count));
}

std::uint32_t PiecePriorityPolicy::on_progress(engine::TransferHandle& handle) const {
    engine::EngineCounters counters;
    try {
        counters = handle.counters();
    } catch (const engine::EngineError& e) {
        LOG_DEBUG("Skipping priority tick: {}", e.what());
        return 0;
    }
    return raise(handle, playback_window(counters.progress, counters.piece_count));
}

std::uint32_t PiecePriorityPolicy::raise(engine::TransferHandle& handle, PieceWindow window) const {
    std::uint32_t accepted = 0;
    for (auto piece = window.first; piece < window.last; ++piece) {
        try {
            if (handle.set_piece_priority(piece, engine::PiecePriority::HIGH)) {
                accepted++;
            }
        } catch (const engine::EngineError& e) {
            LOG_TRACE("Could not set priority for piece {}: {}", piece, e.what());
        }
    }
    return accepted;
}

}
