// TileWorld World System
// terrain_settings.hpp - Typed, validated view over the configuration store

#pragma once

#include "elevation_module.hpp"
#include "geology_module.hpp"
#include "hydrology_module.hpp"
#include "terrain_classifier.hpp"
#include "tree_layer.hpp"
#include "types.hpp"

#include <tileworld/core/config.hpp>
#include <tileworld/core/status.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tileworld::world {

struct WorldConfig {
    WorldBounds bounds{};
    int64_t seed = 12345;
    std::vector<std::string> modules = {"geology", "elevation", "hydrology"};
};

struct TerrainTypeInfo {
    std::string symbol = "?";
    std::string style_tag = "terrain-unknown";
    std::string display_name = "Unknown";
    bool walkable = true;
};

class TerrainTypeTable {
public:
    TerrainTypeTable();

    [[nodiscard]] const TerrainTypeInfo& get(TerrainKind kind) const { return types_[static_cast<size_t>(kind)]; }
    void set(TerrainKind kind, TerrainTypeInfo info) { types_[static_cast<size_t>(kind)] = std::move(info); }

    [[nodiscard]] bool is_walkable(TerrainKind kind) const { return get(kind).walkable; }

private:
    std::array<TerrainTypeInfo, TERRAIN_KIND_COUNT> types_;
};

struct PerformanceConfig {
    uint64_t deer_update_interval_ms = 750;
    uint64_t companion_update_interval_ms = 200;
    int32_t statistics_sample_step = 8;
    int32_t exploration_radius = 8;
    uint64_t max_catch_up_ticks = 16;
    size_t max_cached_samples = 65536;  // Per module; the cache is dropped when exceeded
};

namespace preset_group {
    inline constexpr const char* ELEVATION = "elevation";
    inline constexpr const char* WATER = "water";
    inline constexpr const char* GEOLOGICAL = "geological";
}  // namespace preset_group

// Read-only provider of typed configuration sections. Reads through to the
// store on every call, so writes to the store are visible immediately.
// Section getters throw ConfigurationError or nlohmann::json::exception on
// malformed input; validate() reports the same problems as a Status.
class TerrainSettings {
public:
    explicit TerrainSettings(const core::Config& config);

    [[nodiscard]] WorldConfig get_world_config() const;
    [[nodiscard]] GeologyConfig get_geology_config() const;
    [[nodiscard]] ElevationConfig get_elevation_config() const;
    [[nodiscard]] HydrologyConfig get_hydrology_config() const;
    [[nodiscard]] ClassifierConfig get_classifier_config() const;
    [[nodiscard]] TreeConfig get_tree_config() const;
    [[nodiscard]] TerrainTypeTable get_terrain_types() const;
    [[nodiscard]] PerformanceConfig get_performance_config() const;

    // Section merged with the named preset (shallow overlay); nullopt for unknown presets
    [[nodiscard]] std::optional<ElevationConfig> get_elevation_preset(std::string_view name) const;
    [[nodiscard]] std::optional<HydrologyConfig> get_water_preset(std::string_view level) const;
    [[nodiscard]] std::optional<GeologyConfig> get_geological_preset(std::string_view name) const;

    // Raw preset object, or nullopt
    [[nodiscard]] std::optional<nlohmann::json> get_preset_overlay(std::string_view group,
                                                                   std::string_view name) const;
    [[nodiscard]] std::vector<std::string> get_preset_names(std::string_view group) const;

    [[nodiscard]] core::Status validate() const;

    [[nodiscard]] const core::Config& get_config() const { return config_; }

private:
    const core::Config& config_;
};

// Section parsers, shared with preset resolution
[[nodiscard]] GeologyConfig parse_geology_config(const nlohmann::json& section);
[[nodiscard]] ElevationConfig parse_elevation_config(const nlohmann::json& section);
[[nodiscard]] HydrologyConfig parse_hydrology_config(const nlohmann::json& section);

}  // namespace tileworld::world
