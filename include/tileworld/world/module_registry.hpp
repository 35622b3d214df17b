// TileWorld World System
// module_registry.hpp - Named constructors for terrain modules

#pragma once

#include "terrain_module.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tileworld::world {

class TerrainSettings;

// Builds a module from the current settings
using ModuleFactory = std::function<std::unique_ptr<TerrainModule>(const TerrainSettings&)>;

class ModuleRegistry {
public:
    ModuleRegistry() = default;

    // Replaces any factory already registered under `name`
    void register_module_type(std::string name, ModuleFactory factory);

    [[nodiscard]] bool has_module_type(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> get_registered_types() const;

    // Returns nullptr for unregistered names
    [[nodiscard]] std::unique_ptr<TerrainModule> create_module(std::string_view name,
                                                               const TerrainSettings& settings) const;

    // Register geology, elevation and hydrology
    void register_defaults();

    [[nodiscard]] static ModuleRegistry with_defaults();

private:
    std::map<std::string, ModuleFactory, std::less<>> factories_;
};

}  // namespace tileworld::world
