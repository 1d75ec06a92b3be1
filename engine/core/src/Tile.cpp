#include "blast/core/Tile.hpp"

namespace blast::core {

bool IsLegalTransition(TileState from, TileState to) noexcept {
    switch (from) {
        case TileState::Spawning:
            return to == TileState::Idle;
        case TileState::Idle:
            return to == TileState::Blasting || to == TileState::Falling ||
                   to == TileState::Shuffling;
        case TileState::Falling:
        case TileState::Shuffling:
            return to == TileState::Idle;
        case TileState::Blasting:
            return false;
    }
    return false;
}

const char* ToString(TileState state) noexcept {
    switch (state) {
        case TileState::Spawning:
            return "Spawning";
        case TileState::Idle:
            return "Idle";
        case TileState::Blasting:
            return "Blasting";
        case TileState::Falling:
            return "Falling";
        case TileState::Shuffling:
            return "Shuffling";
    }
    return "Unknown";
}

const char* ToString(IconTier tier) noexcept {
    switch (tier) {
        case IconTier::Default:
            return "Default";
        case IconTier::First:
            return "First";
        case IconTier::Second:
            return "Second";
        case IconTier::Third:
            return "Third";
    }
    return "Unknown";
}

}  // namespace blast::core
