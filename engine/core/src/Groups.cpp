#include "blast/core/Groups.hpp"

#include <deque>
#include <unordered_set>

namespace blast::core {

namespace {

Group FloodFill(const Board& board, const Tile& seed) {
    Group group;
    group.color = seed.color;

    std::deque<Cell> queue;
    std::unordered_set<Cell, CellHash> visited;
    queue.push_back(seed.cell());
    visited.insert(seed.cell());

    while (!queue.empty()) {
        const Cell current = queue.front();
        queue.pop_front();
        group.cells.push_back(current);

        for (const auto& offset : kNeighborOffsets) {
            const Cell neighbor{current.col + offset[0], current.row + offset[1]};
            if (visited.count(neighbor) > 0) {
                continue;
            }
            const Tile* tile = board.get(neighbor);
            if (tile == nullptr || tile->color != group.color || !tile->canBeGrouped()) {
                continue;
            }
            visited.insert(neighbor);
            queue.push_back(neighbor);
        }
    }
    return group;
}

}  // namespace

std::optional<Group> FindGroup(const Board& board, int col, int row, int min_group_size) {
    const Tile* seed = board.get(col, row);
    if (seed == nullptr || !seed->canBeGrouped()) {
        return std::nullopt;
    }
    Group group = FloodFill(board, *seed);
    if (group.size() < min_group_size) {
        return std::nullopt;
    }
    return group;
}

std::optional<Group> FindGroup(const Board& board, const Cell& seed, int min_group_size) {
    return FindGroup(board, seed.col, seed.row, min_group_size);
}

void RefreshGroupMetadata(Board& board, const Palette& palette) {
    board.forEach([](Tile& tile) {
        if (tile.canBeGrouped()) {
            tile.group_size = 1;
            tile.icon = IconTier::Default;
        }
    });

    std::vector<bool> visited(static_cast<std::size_t>(board.cols()) *
                                  static_cast<std::size_t>(board.rows()),
                              false);
    auto mark = [&](const Cell& cell) {
        visited[static_cast<std::size_t>(cell.row * board.cols() + cell.col)] = true;
    };

    for (int row = 0; row < board.rows(); ++row) {
        for (int col = 0; col < board.cols(); ++col) {
            if (visited[static_cast<std::size_t>(row * board.cols() + col)]) {
                continue;
            }
            const Tile* seed = board.get(col, row);
            if (seed == nullptr || !seed->canBeGrouped()) {
                continue;
            }
            const auto group = FindGroup(board, col, row, palette.min_group_size);
            if (!group) {
                mark(Cell{col, row});
                continue;
            }
            const IconTier tier = palette.TierFor(group->size());
            for (const auto& cell : group->cells) {
                Tile* member = board.get(cell);
                member->group_size = group->size();
                member->icon = tier;
                mark(cell);
            }
        }
    }
}

bool IsDeadlocked(const Board& board, int min_group_size) {
    for (int row = 0; row < board.rows(); ++row) {
        for (int col = 0; col < board.cols(); ++col) {
            const Tile* tile = board.get(col, row);
            if (tile == nullptr || !tile->canBeGrouped()) {
                continue;
            }
            if (FindGroup(board, col, row, min_group_size)) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace blast::core
