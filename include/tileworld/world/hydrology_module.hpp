// TileWorld World System
// hydrology_module.hpp - Lakes, springs and rivers derived from elevation and geology

#pragma once

#include "sample_grid.hpp"
#include "terrain_module.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tileworld::world {

// ============================================================================
// Hydrology Configuration
// ============================================================================

struct HydrologyConfig {
    // Springs
    int spring_count = 8;
    float spring_elevation_min = 0.25f;
    float spring_spacing = 12.0f;
    int spring_candidates = 400;

    // Rivers
    int max_river_length = 100;
    int min_river_length = 10;
    float hard_rock_avoidance = 0.4f;
    float soft_rock_preference = 0.6f;
    float clay_channeling = 0.4f;
    bool confluence_enabled = true;
    int confluence_distance = 8;

    // Lakes
    int lake_count = 4;
    int min_lake_radius = 6;
    int max_lake_radius = 18;
    float lake_spacing = 35.0f;
    int lake_sample_step = 12;
    float lake_low_elevation_max = 0.3f;
    float lake_retention_min = 0.35f;
    float lake_clay_preference = 0.6f;
    float lake_hard_rock_avoidance = 0.4f;
};

enum class WaterBody : uint8_t {
    None = 0,
    River,
    Lake
};

struct River {
    uint32_t id = 0;
    std::vector<Position> path;  // Source first
    Position source{0, 0};
    bool reaches_lake = false;
    bool reaches_boundary = false;
    bool joins_river = false;
};

struct Lake {
    uint32_t id = 0;
    Position center{0, 0};
    int32_t radius = 0;
    float elevation = 0.0f;
    RockType rock_type = RockType::Soft;
    size_t cell_count = 0;
};

struct HydrologyStats {
    size_t river_count = 0;
    size_t lake_count = 0;
    size_t spring_count = 0;
    size_t river_cells = 0;
    size_t lake_cells = 0;
    size_t rivers_reaching_lake = 0;
    size_t confluences = 0;
    size_t dropped_rivers = 0;
};

// ============================================================================
// Hydrology Module
// ============================================================================

class HydrologyModule final : public TerrainModule {
public:
    static constexpr const char* NAME = "hydrology";
    static constexpr int PRIORITY = 90;

    explicit HydrologyModule(const HydrologyConfig& config = {});
    ~HydrologyModule() override;

    HydrologyModule(const HydrologyModule&) = delete;
    HydrologyModule& operator=(const HydrologyModule&) = delete;

    [[nodiscard]] std::string_view get_name() const override { return NAME; }
    [[nodiscard]] int get_priority() const override { return PRIORITY; }
    [[nodiscard]] std::vector<std::string> get_dependencies() const override;

    void generate(const WorldContext& context) override;
    [[nodiscard]] ModuleSample get_data_at(int32_t x, int32_t y, const WorldContext& context) const override;
    [[nodiscard]] bool is_generated() const override;

    // ------------------------------------------------------------------------
    // Water queries
    // ------------------------------------------------------------------------

    [[nodiscard]] WaterBody get_water_body_at(int32_t x, int32_t y) const;
    [[nodiscard]] bool is_water_at(int32_t x, int32_t y) const;
    [[nodiscard]] bool is_in_lake(int32_t x, int32_t y) const;
    [[nodiscard]] bool is_on_river(int32_t x, int32_t y) const;

    // Chebyshev distance to the nearest water cell, nullopt beyond max_distance
    [[nodiscard]] std::optional<int32_t> get_distance_to_water(int32_t x, int32_t y,
                                                               int32_t max_distance = 10) const;

    // 1.0 on water, falling off with distance to 0.2
    [[nodiscard]] float get_moisture_at(int32_t x, int32_t y) const;

    [[nodiscard]] const std::vector<River>& get_rivers() const;
    [[nodiscard]] const std::vector<Lake>& get_lakes() const;
    [[nodiscard]] const std::vector<Position>& get_springs() const;
    [[nodiscard]] HydrologyStats get_stats() const;
    [[nodiscard]] const HydrologyConfig& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tileworld::world
