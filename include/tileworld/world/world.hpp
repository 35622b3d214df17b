// TileWorld World System
// world.hpp - Lazily materialised tile world over the terrain pipeline

#pragma once

#include "module_registry.hpp"
#include "terrain_classifier.hpp"
#include "terrain_settings.hpp"
#include "tree_layer.hpp"
#include "types.hpp"
#include "world_generator.hpp"

#include <tileworld/core/config.hpp>
#include <tileworld/core/status.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tileworld::world {

// Memoised per-position state. Only `discovered` changes after creation.
struct WorldCell {
    TerrainKind terrain = TerrainKind::Plains;
    float elevation = 0.2f;
    bool discovered = false;
    bool walkable = true;
};

// What get_terrain_at reports: the cell plus any feature on it
struct TerrainRecord {
    TerrainKind terrain = TerrainKind::Unknown;
    float elevation = 0.2f;
    bool discovered = false;
    bool walkable = false;
    std::optional<TileFeature> feature;
};

// Record handed to the view layer
struct RenderedCell {
    std::string symbol;
    std::string style_tag;
    std::string display_name;
    TerrainKind terrain = TerrainKind::Unknown;
    std::optional<TileFeature> feature;
    bool discovered = false;
    float elevation = 0.2f;

    // Overlays
    std::optional<uint32_t> deer;  // Id of the deer drawn here
    bool companion = false;

    bool operator==(const RenderedCell&) const = default;
};

struct TerrainStatistics {
    int32_t sample_step = 1;
    size_t total_samples = 0;
    std::array<size_t, TERRAIN_KIND_COUNT> counts{};

    [[nodiscard]] size_t count(TerrainKind kind) const { return counts[static_cast<size_t>(kind)]; }
    [[nodiscard]] double percentage(TerrainKind kind) const {
        return total_samples == 0 ? 0.0 : 100.0 * static_cast<double>(count(kind)) / static_cast<double>(total_samples);
    }
};

// ============================================================================
// World
// ============================================================================

class World {
public:
    explicit World(core::Config& config, ModuleRegistry registry = ModuleRegistry::with_defaults());
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // Validate configuration and run the module pipeline
    [[nodiscard]] core::Status initialize();
    [[nodiscard]] bool is_initialized() const;

    // ------------------------------------------------------------------------
    // Cell queries
    // ------------------------------------------------------------------------

    /// Outside bounds: the `unknown` record, elevation 0.2, not discovered.
    /// Inside bounds: the memoised cell, created on first access.
    [[nodiscard]] TerrainRecord get_terrain_at(int32_t x, int32_t y) const;

    [[nodiscard]] bool is_in_bounds(int32_t x, int32_t y) const;

    // Terrain walkability only
    [[nodiscard]] bool can_move_to(int32_t x, int32_t y) const;

    // can_move_to and no tree trunk
    [[nodiscard]] bool is_passable(int32_t x, int32_t y) const;

    [[nodiscard]] std::optional<TileFeature> get_feature_at(int32_t x, int32_t y) const;

    // OutOfBounds outside the world; no-op for cells not yet created
    [[nodiscard]] core::Status mark_discovered(int32_t x, int32_t y);

    // Marks existing cells within the Euclidean radius, returns how many flipped
    size_t mark_discovered_around(const Position& center, int32_t radius);

    // ------------------------------------------------------------------------
    // Regeneration and configuration commands
    // ------------------------------------------------------------------------

    [[nodiscard]] core::Status regenerate_world();
    [[nodiscard]] core::Status regenerate_module(std::string_view name);

    // Presets are written into configuration; regeneration is a separate command
    [[nodiscard]] core::Status apply_geological_preset(std::string_view name);
    [[nodiscard]] core::Status quick_config_elevation(std::string_view method);
    [[nodiscard]] core::Status quick_config_water(std::string_view level);

    // Shallow overlay of `values` on `section`; rolled back if validation fails
    [[nodiscard]] core::Status update_configuration(std::string_view section, const nlohmann::json& values);

    // ------------------------------------------------------------------------
    // Reporting
    // ------------------------------------------------------------------------

    // step <= 0 uses performance.statistics_sample_step
    [[nodiscard]] TerrainStatistics get_terrain_statistics(int32_t step = 0) const;

    [[nodiscard]] nlohmann::json export_world_state() const;

    [[nodiscard]] RenderedCell render_cell(int32_t x, int32_t y) const;

    [[nodiscard]] PositionAnalysis analyze_position(int32_t x, int32_t y) const;

    // ------------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------------

    [[nodiscard]] const WorldBounds& get_bounds() const;
    [[nodiscard]] int64_t get_seed() const;
    [[nodiscard]] const TerrainTypeTable& get_terrain_types() const;
    [[nodiscard]] const PerformanceConfig& get_performance_config() const;
    [[nodiscard]] const TerrainSettings& get_settings() const;
    [[nodiscard]] const WorldGenerator& get_generator() const;
    [[nodiscard]] const TreeLayer& get_trees() const;
    [[nodiscard]] size_t get_cell_count() const;

    [[nodiscard]] core::Config& get_config();
    [[nodiscard]] const core::Config& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tileworld::world
