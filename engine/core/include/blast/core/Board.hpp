#pragma once

#include <functional>
#include <optional>
#include <random>
#include <vector>

#include "blast/core/GameConfig.hpp"
#include "blast/core/Tile.hpp"
#include "blast/core/Types.hpp"

namespace blast::core {

inline constexpr int kEmptyCell = -1;

// Dense cols x rows slot store. Owns every tile on the board and the random
// engine used for spawning and shuffling. Out-of-bounds access is a normal
// outcome of neighbor probing: reads return nullptr and writes do nothing.
class Board {
public:
    Board() = default;
    Board(int cols, int rows, int color_count, std::uint32_t seed = std::random_device{}());

    int cols() const noexcept { return cols_; }
    int rows() const noexcept { return rows_; }
    int colorCount() const noexcept { return color_count_; }

    bool inBounds(int col, int row) const noexcept;
    bool inBounds(const Cell& cell) const noexcept { return inBounds(cell.col, cell.row); }

    Tile* get(int col, int row) noexcept;
    const Tile* get(int col, int row) const noexcept;
    Tile* get(const Cell& cell) noexcept { return get(cell.col, cell.row); }
    const Tile* get(const Cell& cell) const noexcept { return get(cell.col, cell.row); }

    // Color at the slot, or kEmptyCell.
    int colorAt(int col, int row) const noexcept;

    void set(int col, int row, const Tile& tile) noexcept;
    void set(const Cell& cell, const Tile& tile) noexcept { set(cell.col, cell.row, tile); }

    void clear(int col, int row) noexcept;
    void clear(const Cell& cell) noexcept { clear(cell.col, cell.row); }
    void clearAll() noexcept;

    // Moves the slot content and rewrites the tile's coordinates.
    void moveTile(const Cell& from, const Cell& to) noexcept;

    // Creates a tile with a fresh id in the slot. Returns nullptr out of bounds.
    Tile* spawn(int col, int row, int color, TileState state = TileState::Spawning);

    Tile* find(TileId id) noexcept;
    const Tile* find(TileId id) const noexcept;

    // Occupied slots only, row-major (bottom row first).
    void forEach(const std::function<void(Tile&)>& fn);
    void forEach(const std::function<void(const Tile&)>& fn) const;
    std::vector<Tile> allTiles() const;
    int occupiedCount() const noexcept;

    int randomColor();

    std::mt19937& rng() noexcept { return rng_; }
    const std::mt19937& rng() const noexcept { return rng_; }

private:
    int index(int col, int row) const noexcept;

    int cols_{0};
    int rows_{0};
    int color_count_{0};
    TileId next_id_{kInvalidTile + 1};
    std::vector<std::optional<Tile>> slots_;
    std::mt19937 rng_{};
};

// Builds the starting board from config.initial_layout, or random colors when
// no layout is given. Initial tiles are Idle.
Board NewBoard(const GameConfig& config);
Board NewBoard(const GameConfig& config, std::uint32_t seed);

}  // namespace blast::core
