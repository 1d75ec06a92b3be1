#pragma once

#include <vector>

#include "blast/core/Groups.hpp"
#include "blast/core/Lifecycle.hpp"

namespace blast::core {

enum class BlastStatus { Started, InvalidGroup, Busy };

const char* ToString(BlastStatus status) noexcept;

// True when the cells are exactly the maximal connected group of Idle tiles of
// group.color around any member, and it is at least min_group_size large.
bool ValidateGroup(const Board& board, const Group& group, int min_group_size);

class BlastResolver {
public:
    BlastResolver(Board& board, TileLifecycle& lifecycle) : board_(board), lifecycle_(lifecycle) {}

    // Marks every member Blasting. The slots stay occupied until Finish().
    BlastStatus Begin(const Group& group, int min_group_size);

    // Clears the pending group's slots and returns the removed tiles.
    std::vector<Tile> Finish();

    bool pending() const noexcept { return !pending_.empty(); }
    void Reset() noexcept { pending_.clear(); }

private:
    Board& board_;
    TileLifecycle& lifecycle_;
    std::vector<TileId> pending_;
};

}  // namespace blast::core
