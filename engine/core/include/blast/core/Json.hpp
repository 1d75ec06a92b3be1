#pragma once

#include <nlohmann/json.hpp>

namespace blast::core {

using Json = nlohmann::json;

}  // namespace blast::core
