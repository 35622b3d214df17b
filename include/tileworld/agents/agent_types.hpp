// TileWorld Agents
// agent_types.hpp - Types shared by the agent managers

#pragma once

#include <tileworld/world/types.hpp>

#include <functional>
#include <optional>

namespace tileworld::agents {

// Current player position, or nullopt when it cannot be determined
using PlayerLocator = std::function<std::optional<world::Position>()>;

}  // namespace tileworld::agents
