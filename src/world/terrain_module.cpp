// TileWorld World System
// terrain_module.cpp - Generation context implementation

#include <tileworld/world/terrain_module.hpp>

namespace tileworld::world {

void WorldContext::bind_module(std::string_view name, const TerrainModule* module) {
    modules_[std::string(name)] = module;
}

void WorldContext::unbind_module(std::string_view name) {
    modules_.erase(std::string(name));
}

const TerrainModule* WorldContext::find_module(std::string_view name) const {
    auto it = modules_.find(std::string(name));
    return it != modules_.end() ? it->second : nullptr;
}

}  // namespace tileworld::world
