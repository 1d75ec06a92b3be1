#pragma once

#include "blast/core/Board.hpp"
#include "blast/core/Events.hpp"

namespace blast::core {

// Applies tile state transitions and records one TileStateChanged message per
// transition. Illegal transitions leave the tile untouched.
class TileLifecycle {
public:
    TileLifecycle(Board& board, EventQueue& events) : board_(board), events_(events) {}

    bool Transition(TileId id, TileState next);
    bool Transition(Tile& tile, TileState next);

private:
    Board& board_;
    EventQueue& events_;
};

}  // namespace blast::core
