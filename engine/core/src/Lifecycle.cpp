#include "blast/core/Lifecycle.hpp"

#include <SDL2/SDL_log.h>

namespace blast::core {

bool TileLifecycle::Transition(TileId id, TileState next) {
    Tile* tile = board_.find(id);
    if (tile == nullptr) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Transition to %s for unknown tile %u",
                    ToString(next), static_cast<unsigned>(id));
        return false;
    }
    return Transition(*tile, next);
}

bool TileLifecycle::Transition(Tile& tile, TileState next) {
    const TileState previous = tile.state;
    if (!IsLegalTransition(previous, next)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Rejected tile %u transition %s -> %s",
                    static_cast<unsigned>(tile.id), ToString(previous), ToString(next));
        return false;
    }
    tile.state = next;

    PipelineEvent event;
    event.type = PipelineEventType::TileStateChanged;
    event.tile = tile;
    event.old_state = previous;
    event.new_state = next;
    events_.push_back(std::move(event));
    return true;
}

}  // namespace blast::core
