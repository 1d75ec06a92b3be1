#pragma once

#include <optional>
#include <vector>

#include "blast/core/Board.hpp"
#include "blast/core/Palette.hpp"

namespace blast::core {

struct Group {
    int color = kEmptyCell;
    std::vector<Cell> cells;

    int size() const noexcept { return static_cast<int>(cells.size()); }
    bool empty() const noexcept { return cells.empty(); }
};

// Maximal 4-connected component of Idle tiles sharing the seed's color.
// nullopt when the seed is empty, not groupable, or the component is smaller
// than min_group_size.
std::optional<Group> FindGroup(const Board& board, int col, int row, int min_group_size);
std::optional<Group> FindGroup(const Board& board, const Cell& seed, int min_group_size);

// Recomputes every tile's cached group size and icon tier.
void RefreshGroupMetadata(Board& board, const Palette& palette);

bool IsDeadlocked(const Board& board, int min_group_size);

}  // namespace blast::core
