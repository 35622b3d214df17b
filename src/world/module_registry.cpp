// TileWorld World System
// module_registry.cpp - Terrain module registry implementation

#include <tileworld/core/logger.hpp>
#include <tileworld/world/elevation_module.hpp>
#include <tileworld/world/geology_module.hpp>
#include <tileworld/world/hydrology_module.hpp>
#include <tileworld/world/module_registry.hpp>
#include <tileworld/world/terrain_settings.hpp>

namespace tileworld::world {

void ModuleRegistry::register_module_type(std::string name, ModuleFactory factory) {
    TILEWORLD_LOG_DEBUG(core::log_category::TERRAIN, "Registered module type '{}'", name);
    factories_[std::move(name)] = std::move(factory);
}

bool ModuleRegistry::has_module_type(std::string_view name) const {
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> ModuleRegistry::get_registered_types() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<TerrainModule> ModuleRegistry::create_module(std::string_view name,
                                                             const TerrainSettings& settings) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        return nullptr;
    }
    return it->second(settings);
}

void ModuleRegistry::register_defaults() {
    register_module_type(GeologyModule::NAME, [](const TerrainSettings& settings) {
        return std::make_unique<GeologyModule>(settings.get_geology_config());
    });
    register_module_type(ElevationModule::NAME, [](const TerrainSettings& settings) {
        return std::make_unique<ElevationModule>(settings.get_elevation_config());
    });
    register_module_type(HydrologyModule::NAME, [](const TerrainSettings& settings) {
        return std::make_unique<HydrologyModule>(settings.get_hydrology_config());
    });
}

ModuleRegistry ModuleRegistry::with_defaults() {
    ModuleRegistry registry;
    registry.register_defaults();
    return registry;
}

}  // namespace tileworld::world
