#pragma once

#include <vector>

#include "blast/core/Tile.hpp"
#include "blast/core/Types.hpp"

namespace blast::core {

struct TileMove {
    TileId tile = kInvalidTile;
    int color = 0;
    Cell from{};
    Cell to{};
};

struct GravityResult {
    std::vector<TileMove> fell;
    // from is the virtual slot above the board the tile drops in from.
    std::vector<TileMove> spawned;

    bool empty() const noexcept { return fell.empty() && spawned.empty(); }
};

struct ShuffleAssignment {
    TileId tile = kInvalidTile;
    Cell from{};
    Cell to{};
};

struct GuaranteedCluster {
    int color = 0;
    std::vector<Cell> cells;
};

struct ShuffleResult {
    std::vector<ShuffleAssignment> mapping;
    int requested_colors = 0;
    std::vector<GuaranteedCluster> guaranteed;
    int shortfall = 0;
    bool emergency_fix_applied = false;
    std::vector<Cell> recolored;
    bool still_deadlocked = false;
};

enum class PipelineEventType {
    TileStateChanged,
    BlastComplete,
    GravityComplete,
    ShuffleStarted,
    ShuffleComplete,
    Ready
};

struct PipelineEvent {
    PipelineEventType type = PipelineEventType::Ready;

    // TileStateChanged
    Tile tile{};
    TileState old_state = TileState::Idle;
    TileState new_state = TileState::Idle;

    // BlastComplete
    std::vector<Tile> removed;

    // GravityComplete
    GravityResult gravity;

    // ShuffleStarted, ShuffleComplete
    ShuffleResult shuffle;
};

using EventQueue = std::vector<PipelineEvent>;

}  // namespace blast::core
