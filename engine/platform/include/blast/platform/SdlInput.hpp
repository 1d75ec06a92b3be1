#pragma once

#include <vector>

#include "blast/platform/InputEvents.hpp"

namespace blast::platform {

// Translates the SDL event queue into InputEvents.
class SdlInput {
public:
    std::vector<InputEvent> Poll();
};

}  // namespace blast::platform
