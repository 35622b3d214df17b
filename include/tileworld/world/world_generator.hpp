// TileWorld World System
// world_generator.hpp - Dependency-ordered terrain module pipeline

#pragma once

#include "module_registry.hpp"
#include "terrain_module.hpp"
#include "types.hpp"

#include <tileworld/core/status.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tileworld::world {

class TerrainSettings;

// Topological order of `modules` by dependency, ties by descending priority
// then name. Fails with ConfigurationInvalid on a cycle or missing dependency.
[[nodiscard]] core::Status resolve_generation_order(const std::vector<const TerrainModule*>& modules,
                                                    std::vector<std::string>& order);

struct PositionAnalysis {
    Position position{0, 0};
    bool in_bounds = false;
    float elevation = 0.0f;
    float slope = 0.0f;
    std::optional<RockType> rock_type;
    float soil_quality = 0.0f;
    float water_retention = 0.0f;
    float moisture = 0.0f;
    bool is_water = false;
    bool is_lake = false;
    bool is_river = false;
    std::vector<std::string> features;

    // Suitability scores in [0, 1]
    float settlement_suitability = 0.0f;
    float agriculture_suitability = 0.0f;
    float defense_suitability = 0.0f;
};

// ============================================================================
// World Generator
// ============================================================================

class WorldGenerator {
public:
    WorldGenerator(const TerrainSettings& settings, const ModuleRegistry& registry);
    ~WorldGenerator();

    WorldGenerator(const WorldGenerator&) = delete;
    WorldGenerator& operator=(const WorldGenerator&) = delete;

    // Build every module in `world.modules` from the current settings.
    // Nothing is replaced unless every module generates.
    [[nodiscard]] core::Status initialize();
    [[nodiscard]] core::Status regenerate_all();

    // Rebuild `name` and every module that transitively depends on it.
    // Prior fields stay intact on failure.
    [[nodiscard]] core::Status regenerate_module(std::string_view name);

    [[nodiscard]] bool is_initialized() const;
    [[nodiscard]] const WorldContext& get_context() const;
    [[nodiscard]] const std::vector<std::string>& get_generation_order() const;

    [[nodiscard]] const TerrainModule* get_module(std::string_view name) const;

    template <typename T>
    [[nodiscard]] const T* get_module_as(std::string_view name) const {
        return dynamic_cast<const T*>(get_module(name));
    }

    // Cached per-module output; empty sample for unknown modules
    [[nodiscard]] ModuleSample get_module_data(std::string_view name, int32_t x, int32_t y) const;

    // All modules merged: later modules override terrain, features are concatenated
    [[nodiscard]] ModuleSample sample_at(int32_t x, int32_t y) const;

    // Elevation module's value, or its configured base when absent
    [[nodiscard]] float get_elevation_at(int32_t x, int32_t y) const;

    [[nodiscard]] PositionAnalysis analyze_position(int32_t x, int32_t y) const;

    void clear_cache();
    [[nodiscard]] size_t get_cache_size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tileworld::world
