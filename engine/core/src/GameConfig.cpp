#include "blast/core/GameConfig.hpp"

#include <algorithm>
#include <limits>

namespace blast::core {

Json GameConfig::ToJson() const {
    Json json;
    json["cols"] = cols;
    json["rows"] = rows;
    json["palette"] = palette.ToJson();
    json["guaranteed_color_count"] = guaranteed_color_count;
    if (seed) {
        json["seed"] = *seed;
    }
    if (!initial_layout.empty()) {
        json["initial_layout"] = initial_layout;
    }
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    if (json.contains("cols") && json["cols"].is_number_integer()) {
        config.cols = std::clamp(json["cols"].get<int>(), kMinBoardSide, kMaxBoardSide);
    }
    if (json.contains("rows") && json["rows"].is_number_integer()) {
        config.rows = std::clamp(json["rows"].get<int>(), kMinBoardSide, kMaxBoardSide);
    }
    if (json.contains("palette") && json["palette"].is_object()) {
        config.palette = Palette::FromJson(json["palette"]);
    }
    if (json.contains("guaranteed_color_count") &&
        json["guaranteed_color_count"].is_number_integer()) {
        config.guaranteed_color_count = json["guaranteed_color_count"].get<int>();
    }
    config.guaranteed_color_count =
        std::clamp(config.guaranteed_color_count, 1, config.palette.colorCount());
    if (json.contains("seed") && json["seed"].is_number_unsigned()) {
        const auto seed = json["seed"].get<std::uint64_t>();
        if (seed <= std::numeric_limits<std::uint32_t>::max()) {
            config.seed = static_cast<std::uint32_t>(seed);
        }
    }
    if (json.contains("initial_layout") && json["initial_layout"].is_array() &&
        json["initial_layout"].size() ==
            static_cast<std::size_t>(config.cols) * static_cast<std::size_t>(config.rows)) {
        std::vector<int> layout;
        layout.reserve(json["initial_layout"].size());
        bool ok = true;
        for (const auto& entry : json["initial_layout"]) {
            if (!entry.is_number_integer()) {
                ok = false;
                break;
            }
            const int color = entry.get<int>();
            if (color != -1 && !config.palette.validColor(color)) {
                ok = false;
                break;
            }
            layout.push_back(color);
        }
        if (ok) {
            config.initial_layout = std::move(layout);
        }
    }
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump();
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace blast::core
