#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "blast/core/Json.hpp"
#include "blast/core/Palette.hpp"

namespace blast::core {

inline constexpr int kMinBoardSide = 2;
inline constexpr int kMaxBoardSide = 32;

struct GameConfig {
    int cols = 8;
    int rows = 10;
    Palette palette{};
    int guaranteed_color_count = 1;
    std::optional<std::uint32_t> seed;
    // Row-major, bottom row first. -1 leaves the slot empty. Empty vector means random.
    std::vector<int> initial_layout;

    Json ToJson() const;
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

}  // namespace blast::core
