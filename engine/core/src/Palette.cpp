#include "blast/core/Palette.hpp"

#include <algorithm>

namespace blast::core {

IconTier Palette::TierFor(int group_size) const noexcept {
    if (group_size > thresholds.c) {
        return IconTier::Third;
    }
    if (group_size > thresholds.b) {
        return IconTier::Second;
    }
    if (group_size > thresholds.a) {
        return IconTier::First;
    }
    return IconTier::Default;
}

Json Palette::ToJson() const {
    Json json;
    json["colors"] = colors;
    json["min_group_size"] = min_group_size;
    json["thresholds"] = {{"a", thresholds.a}, {"b", thresholds.b}, {"c", thresholds.c}};
    return json;
}

Palette Palette::FromJson(const Json& json) {
    Palette palette;
    if (json.contains("colors") && json["colors"].is_array()) {
        std::vector<std::string> colors;
        for (const auto& entry : json["colors"]) {
            if (entry.is_string()) {
                colors.push_back(entry.get<std::string>());
            }
        }
        if (!colors.empty()) {
            palette.colors = std::move(colors);
        }
    }
    if (json.contains("min_group_size") && json["min_group_size"].is_number_integer()) {
        palette.min_group_size =
            std::max(kDefaultMinGroupSize, json["min_group_size"].get<int>());
    }
    if (json.contains("thresholds") && json["thresholds"].is_object()) {
        const auto& thresholds = json["thresholds"];
        auto read = [&](const char* key, int& out) {
            if (thresholds.contains(key) && thresholds[key].is_number_integer()) {
                out = thresholds[key].get<int>();
            }
        };
        read("a", palette.thresholds.a);
        read("b", palette.thresholds.b);
        read("c", palette.thresholds.c);
        palette.thresholds.b = std::max(palette.thresholds.a, palette.thresholds.b);
        palette.thresholds.c = std::max(palette.thresholds.b, palette.thresholds.c);
    }
    return palette;
}

}  // namespace blast::core
