#pragma once

#include "blast/core/Events.hpp"
#include "blast/core/Lifecycle.hpp"

namespace blast::core {

// Compacts each column toward row 0 and refills the vacated top slots with
// random colors. Moved tiles become Falling, new tiles start Spawning. Relative
// order within a column never changes.
GravityResult ApplyGravityAndRefill(Board& board, TileLifecycle& lifecycle);

}  // namespace blast::core
