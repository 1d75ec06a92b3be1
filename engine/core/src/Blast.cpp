#include "blast/core/Blast.hpp"

#include <unordered_set>

#include <SDL2/SDL_log.h>

namespace blast::core {

const char* ToString(BlastStatus status) noexcept {
    switch (status) {
        case BlastStatus::Started:
            return "Started";
        case BlastStatus::InvalidGroup:
            return "InvalidGroup";
        case BlastStatus::Busy:
            return "Busy";
    }
    return "Unknown";
}

bool ValidateGroup(const Board& board, const Group& group, int min_group_size) {
    if (group.empty() || group.size() < min_group_size) {
        return false;
    }
    std::unordered_set<Cell, CellHash> seen;
    for (const auto& cell : group.cells) {
        if (!seen.insert(cell).second) {
            return false;
        }
        const Tile* tile = board.get(cell);
        if (tile == nullptr || !tile->canBeGrouped() || tile->color != group.color) {
            return false;
        }
    }
    // The cells must be exactly one maximal connected group, not a subset or
    // several disjoint pieces.
    const auto actual = FindGroup(board, group.cells.front(), min_group_size);
    if (!actual || actual->size() != group.size()) {
        return false;
    }
    for (const auto& cell : actual->cells) {
        if (seen.count(cell) == 0) {
            return false;
        }
    }
    return true;
}

BlastStatus BlastResolver::Begin(const Group& group, int min_group_size) {
    if (!ValidateGroup(board_, group, min_group_size)) {
        return BlastStatus::InvalidGroup;
    }

    pending_.clear();
    pending_.reserve(group.cells.size());
    for (const auto& cell : group.cells) {
        Tile* tile = board_.get(cell);
        pending_.push_back(tile->id);
        lifecycle_.Transition(*tile, TileState::Blasting);
    }
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Blasting %d tiles", group.size());
    return BlastStatus::Started;
}

std::vector<Tile> BlastResolver::Finish() {
    std::vector<Tile> removed;
    removed.reserve(pending_.size());
    for (const TileId id : pending_) {
        const Tile* tile = board_.find(id);
        if (tile == nullptr) {
            continue;
        }
        removed.push_back(*tile);
        board_.clear(tile->col, tile->row);
    }
    pending_.clear();
    return removed;
}

}  // namespace blast::core
