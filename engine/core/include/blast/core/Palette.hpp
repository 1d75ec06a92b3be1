#pragma once

#include <string>
#include <vector>

#include "blast/core/Json.hpp"
#include "blast/core/Tile.hpp"

namespace blast::core {

inline constexpr int kDefaultMinGroupSize = 2;

struct TierThresholds {
    int a = 4;
    int b = 7;
    int c = 9;
};

struct Palette {
    std::vector<std::string> colors{"red", "green", "blue", "yellow", "purple", "pink"};
    int min_group_size = kDefaultMinGroupSize;
    TierThresholds thresholds{};

    int colorCount() const noexcept { return static_cast<int>(colors.size()); }
    bool validColor(int color) const noexcept { return color >= 0 && color < colorCount(); }

    IconTier TierFor(int group_size) const noexcept;

    Json ToJson() const;
    static Palette FromJson(const Json& json);
};

}  // namespace blast::core
