#include "blast/core/Shuffle.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <map>
#include <unordered_map>

#include <SDL2/SDL_log.h>

namespace blast::core {

namespace {

std::array<Cell, 4> ShuffledDirections(std::mt19937& rng) {
    std::vector<Cell> dirs;
    dirs.reserve(4);
    for (const auto& offset : kNeighborOffsets) {
        dirs.push_back(Cell{offset[0], offset[1]});
    }
    FisherYates(dirs, rng);
    return {dirs[0], dirs[1], dirs[2], dirs[3]};
}

}  // namespace

std::vector<Cell> FindRandomCluster(Board& board, int count, int min_size, const CellSet& reserved) {
    std::uniform_int_distribution<int> col_dist(0, board.cols() - 1);
    std::uniform_int_distribution<int> row_dist(0, board.rows() - 1);

    auto usable = [&](const Cell& cell) {
        return board.get(cell) != nullptr && reserved.count(cell) == 0;
    };

    for (int attempt = 0; attempt < kClusterSearchAttempts; ++attempt) {
        const Cell start{col_dist(board.rng()), row_dist(board.rng())};
        if (!usable(start)) {
            continue;
        }

        std::vector<Cell> cluster;
        std::deque<Cell> queue;
        CellSet visited;
        queue.push_back(start);
        visited.insert(start);

        while (!queue.empty() && static_cast<int>(cluster.size()) < count) {
            const Cell current = queue.front();
            queue.pop_front();
            cluster.push_back(current);

            for (const auto& dir : ShuffledDirections(board.rng())) {
                const Cell neighbor{current.col + dir.col, current.row + dir.row};
                if (visited.count(neighbor) > 0 || !usable(neighbor)) {
                    continue;
                }
                visited.insert(neighbor);
                queue.push_back(neighbor);
            }
        }

        if (static_cast<int>(cluster.size()) >= min_size) {
            return cluster;
        }
    }
    return {};
}

ShuffleResult ShuffleResolver::Plan(int guaranteed_color_count) {
    const int min_size = palette_.min_group_size;
    const std::vector<Tile> tiles = board_.allTiles();

    std::map<int, std::vector<TileId>> by_color;
    for (const auto& tile : tiles) {
        by_color[tile.color].push_back(tile.id);
    }

    std::vector<int> eligible;
    for (const auto& [color, ids] : by_color) {
        if (static_cast<int>(ids.size()) >= min_size) {
            eligible.push_back(color);
        }
    }
    FisherYates(eligible, board_.rng());
    const int selected_count =
        std::min(std::max(guaranteed_color_count, 0), static_cast<int>(eligible.size()));

    ShuffleResult result;
    result.requested_colors = guaranteed_color_count;

    std::unordered_map<TileId, Cell> targets;
    CellSet reserved;

    for (int i = 0; i < selected_count; ++i) {
        const int color = eligible[static_cast<std::size_t>(i)];
        const auto& ids = by_color[color];
        const int upper =
            std::max(min_size, std::min(static_cast<int>(ids.size()), kMaxGuaranteedClusterSize));
        std::uniform_int_distribution<int> size_dist(min_size, upper);
        const int target_size = size_dist(board_.rng());

        std::vector<Cell> cluster = FindRandomCluster(board_, target_size, min_size, reserved);
        if (cluster.empty()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Shuffle: no free cluster of %d cells for color %d", target_size, color);
            continue;
        }

        GuaranteedCluster placed;
        placed.color = color;
        for (std::size_t k = 0; k < cluster.size() && k < ids.size(); ++k) {
            targets[ids[k]] = cluster[k];
            reserved.insert(cluster[k]);
            placed.cells.push_back(cluster[k]);
        }
        result.guaranteed.push_back(std::move(placed));
    }

    result.shortfall = std::max(0, guaranteed_color_count - static_cast<int>(result.guaranteed.size()));
    if (result.shortfall > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Shuffle guaranteed %zu of %d colors",
                    result.guaranteed.size(), guaranteed_color_count);
    }

    std::vector<Cell> remaining_positions;
    remaining_positions.reserve(tiles.size());
    for (const auto& tile : tiles) {
        if (reserved.count(tile.cell()) == 0) {
            remaining_positions.push_back(tile.cell());
        }
    }
    FisherYates(remaining_positions, board_.rng());

    std::size_t next = 0;
    for (const auto& tile : tiles) {
        if (targets.count(tile.id) > 0) {
            continue;
        }
        if (next < remaining_positions.size()) {
            targets[tile.id] = remaining_positions[next++];
        }
    }

    result.mapping.reserve(tiles.size());
    for (const auto& tile : tiles) {
        auto it = targets.find(tile.id);
        if (it == targets.end()) {
            continue;
        }
        ShuffleAssignment assignment;
        assignment.tile = tile.id;
        assignment.from = tile.cell();
        assignment.to = it->second;
        result.mapping.push_back(assignment);
    }
    return result;
}

void ShuffleResolver::Commit(const ShuffleResult& plan) {
    for (const auto& assignment : plan.mapping) {
        lifecycle_.Transition(assignment.tile, TileState::Shuffling);
    }

    std::vector<Tile> moved;
    moved.reserve(plan.mapping.size());
    for (const auto& assignment : plan.mapping) {
        const Tile* tile = board_.find(assignment.tile);
        if (tile == nullptr) {
            continue;
        }
        Tile copy = *tile;
        copy.col = assignment.to.col;
        copy.row = assignment.to.row;
        moved.push_back(copy);
    }

    board_.clearAll();
    for (const auto& tile : moved) {
        board_.set(tile.col, tile.row, tile);
    }
}

void ShuffleResolver::Finalize(ShuffleResult& result) {
    const int min_size = palette_.min_group_size;
    RefreshGroupMetadata(board_, palette_);
    if (!IsDeadlocked(board_, min_size)) {
        result.still_deadlocked = false;
        return;
    }

    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Still deadlocked after shuffle, applying fix");
    result.recolored = ApplyEmergencyFix();
    result.emergency_fix_applied = !result.recolored.empty();
    RefreshGroupMetadata(board_, palette_);

    result.still_deadlocked = IsDeadlocked(board_, min_size);
    if (result.still_deadlocked) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Board still deadlocked after emergency fix (%dx%d, %d tiles)",
                     board_.cols(), board_.rows(), board_.occupiedCount());
    }
}

std::optional<std::pair<Cell, Cell>> ShuffleResolver::FirstAdjacentPair() const {
    for (int row = 0; row < board_.rows(); ++row) {
        for (int col = 0; col + 1 < board_.cols(); ++col) {
            if (board_.get(col, row) != nullptr && board_.get(col + 1, row) != nullptr) {
                return std::make_pair(Cell{col, row}, Cell{col + 1, row});
            }
        }
    }
    // Only reachable when holes break up every row.
    for (int row = 0; row + 1 < board_.rows(); ++row) {
        for (int col = 0; col < board_.cols(); ++col) {
            if (board_.get(col, row) != nullptr && board_.get(col, row + 1) != nullptr) {
                return std::make_pair(Cell{col, row}, Cell{col, row + 1});
            }
        }
    }
    return std::nullopt;
}

std::vector<Cell> ShuffleResolver::ApplyEmergencyFix() {
    std::vector<Cell> recolored;
    const auto pair = FirstAdjacentPair();
    if (!pair) {
        return recolored;
    }

    const int color = board_.get(pair->first)->color;
    CellSet cluster{pair->first};
    std::deque<Cell> queue{pair->first};

    auto paint = [&](const Cell& cell) {
        Tile* tile = board_.get(cell);
        if (tile->color != color) {
            tile->color = color;
            recolored.push_back(cell);
        }
        cluster.insert(cell);
        queue.push_back(cell);
    };

    paint(pair->second);
    while (!queue.empty() && static_cast<int>(cluster.size()) < palette_.min_group_size) {
        const Cell current = queue.front();
        queue.pop_front();
        for (const auto& offset : kNeighborOffsets) {
            if (static_cast<int>(cluster.size()) >= palette_.min_group_size) {
                break;
            }
            const Cell neighbor{current.col + offset[0], current.row + offset[1]};
            if (cluster.count(neighbor) > 0 || board_.get(neighbor) == nullptr) {
                continue;
            }
            paint(neighbor);
        }
    }
    return recolored;
}

}  // namespace blast::core
