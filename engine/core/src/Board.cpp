#include "blast/core/Board.hpp"

#include <algorithm>

#include <SDL2/SDL_log.h>

namespace blast::core {

Board::Board(int cols, int rows, int color_count, std::uint32_t seed)
    : cols_(cols),
      rows_(rows),
      color_count_(color_count),
      slots_(static_cast<std::size_t>(cols) * static_cast<std::size_t>(rows)),
      rng_(seed) {}

bool Board::inBounds(int col, int row) const noexcept {
    return col >= 0 && col < cols_ && row >= 0 && row < rows_;
}

Tile* Board::get(int col, int row) noexcept {
    if (!inBounds(col, row)) {
        return nullptr;
    }
    auto& slot = slots_[index(col, row)];
    return slot ? &*slot : nullptr;
}

const Tile* Board::get(int col, int row) const noexcept {
    if (!inBounds(col, row)) {
        return nullptr;
    }
    const auto& slot = slots_[index(col, row)];
    return slot ? &*slot : nullptr;
}

int Board::colorAt(int col, int row) const noexcept {
    const Tile* tile = get(col, row);
    return tile ? tile->color : kEmptyCell;
}

void Board::set(int col, int row, const Tile& tile) noexcept {
    if (!inBounds(col, row)) {
        return;
    }
    slots_[index(col, row)] = tile;
}

void Board::clear(int col, int row) noexcept {
    if (!inBounds(col, row)) {
        return;
    }
    slots_[index(col, row)].reset();
}

void Board::clearAll() noexcept {
    for (auto& slot : slots_) {
        slot.reset();
    }
}

void Board::moveTile(const Cell& from, const Cell& to) noexcept {
    if (!inBounds(from) || !inBounds(to) || from == to) {
        return;
    }
    auto& source = slots_[index(from.col, from.row)];
    if (!source) {
        return;
    }
    auto& target = slots_[index(to.col, to.row)];
    target = std::move(source);
    source.reset();
    target->col = to.col;
    target->row = to.row;
}

Tile* Board::spawn(int col, int row, int color, TileState state) {
    if (!inBounds(col, row)) {
        return nullptr;
    }
    Tile tile;
    tile.id = next_id_++;
    tile.col = col;
    tile.row = row;
    tile.color = color;
    tile.state = state;
    auto& slot = slots_[index(col, row)];
    slot = tile;
    return &*slot;
}

Tile* Board::find(TileId id) noexcept {
    for (auto& slot : slots_) {
        if (slot && slot->id == id) {
            return &*slot;
        }
    }
    return nullptr;
}

const Tile* Board::find(TileId id) const noexcept {
    for (const auto& slot : slots_) {
        if (slot && slot->id == id) {
            return &*slot;
        }
    }
    return nullptr;
}

void Board::forEach(const std::function<void(Tile&)>& fn) {
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            auto& slot = slots_[index(col, row)];
            if (slot) {
                fn(*slot);
            }
        }
    }
}

void Board::forEach(const std::function<void(const Tile&)>& fn) const {
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            const auto& slot = slots_[index(col, row)];
            if (slot) {
                fn(*slot);
            }
        }
    }
}

std::vector<Tile> Board::allTiles() const {
    std::vector<Tile> tiles;
    tiles.reserve(slots_.size());
    forEach([&](const Tile& tile) { tiles.push_back(tile); });
    return tiles;
}

int Board::occupiedCount() const noexcept {
    return static_cast<int>(std::count_if(slots_.begin(), slots_.end(),
                                          [](const auto& slot) { return slot.has_value(); }));
}

int Board::randomColor() {
    if (color_count_ <= 0) {
        return 0;
    }
    std::uniform_int_distribution<int> dist(0, color_count_ - 1);
    return dist(rng_);
}

int Board::index(int col, int row) const noexcept {
    return col * rows_ + row;
}

Board NewBoard(const GameConfig& config) {
    return NewBoard(config, config.seed ? *config.seed : std::random_device{}());
}

Board NewBoard(const GameConfig& config, std::uint32_t seed) {
    Board board(config.cols, config.rows, config.palette.colorCount(), seed);
    const bool use_layout =
        config.initial_layout.size() ==
        static_cast<std::size_t>(config.cols) * static_cast<std::size_t>(config.rows);
    for (int row = 0; row < board.rows(); ++row) {
        for (int col = 0; col < board.cols(); ++col) {
            int color = kEmptyCell;
            if (use_layout) {
                color = config.initial_layout[static_cast<std::size_t>(row * config.cols + col)];
            } else {
                color = board.randomColor();
            }
            if (color == kEmptyCell) {
                continue;
            }
            if (!config.palette.validColor(color)) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                            "Layout color %d at (%d,%d) is outside the palette, slot left empty",
                            color, col, row);
                continue;
            }
            board.spawn(col, row, color, TileState::Idle);
        }
    }
    return board;
}

}  // namespace blast::core
