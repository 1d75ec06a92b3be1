#pragma once

#include "blast/core/Types.hpp"

namespace blast::core {

enum class TileState { Spawning, Idle, Blasting, Falling, Shuffling };

enum class IconTier { Default = 0, First = 1, Second = 2, Third = 3 };

struct Tile {
    TileId id = kInvalidTile;
    int col = 0;
    int row = 0;
    int color = 0;
    int group_size = 1;
    IconTier icon = IconTier::Default;
    TileState state = TileState::Spawning;

    Cell cell() const noexcept { return Cell{col, row}; }

    bool canBeGrouped() const noexcept { return state == TileState::Idle; }
    bool canInteract() const noexcept { return state == TileState::Idle; }
};

// Spawning -> Idle, Idle -> {Blasting, Falling, Shuffling}, Falling -> Idle,
// Shuffling -> Idle. Blasting is terminal; the tile is removed afterwards.
bool IsLegalTransition(TileState from, TileState to) noexcept;

const char* ToString(TileState state) noexcept;
const char* ToString(IconTier tier) noexcept;

}  // namespace blast::core
