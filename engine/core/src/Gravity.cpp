#include "blast/core/Gravity.hpp"

#include <SDL2/SDL_log.h>

namespace blast::core {

namespace {

void CompactColumn(Board& board, TileLifecycle& lifecycle, int col, GravityResult& result) {
    int write = 0;
    for (int row = 0; row < board.rows(); ++row) {
        Tile* tile = board.get(col, row);
        if (tile == nullptr) {
            continue;
        }
        if (write != row) {
            const Cell from{col, row};
            const Cell to{col, write};
            TileMove fall;
            fall.tile = tile->id;
            fall.color = tile->color;
            fall.from = from;
            fall.to = to;
            board.moveTile(from, to);
            lifecycle.Transition(*board.get(to), TileState::Falling);
            result.fell.push_back(fall);
        }
        ++write;
    }

    for (int row = write, spawn_index = 0; row < board.rows(); ++row, ++spawn_index) {
        Tile* tile = board.spawn(col, row, board.randomColor(), TileState::Spawning);
        TileMove spawn;
        spawn.tile = tile->id;
        spawn.color = tile->color;
        spawn.from = Cell{col, board.rows() + spawn_index};
        spawn.to = Cell{col, row};
        result.spawned.push_back(spawn);
    }
}

}  // namespace

GravityResult ApplyGravityAndRefill(Board& board, TileLifecycle& lifecycle) {
    GravityResult result;
    for (int col = 0; col < board.cols(); ++col) {
        CompactColumn(board, lifecycle, col, result);
    }
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Gravity: %zu fell, %zu spawned",
                 result.fell.size(), result.spawned.size());
    return result;
}

}  // namespace blast::core
