#pragma once

#include <nlohmann/json.hpp>

namespace tilemerge::core {

using Json = nlohmann::json;

}  // namespace tilemerge::core
