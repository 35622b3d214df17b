// TileWorld World System
// geology_module.hpp - Rock formations, rock-type and soil sample lattices

#pragma once

#include "terrain_module.hpp"
#include "types.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tileworld::world {

// ============================================================================
// Geology Configuration
// ============================================================================

struct RockProperties {
    float erosion_resistance = 0.5f;  // 0 = erodes freely, 1 = resists erosion
    float soil_quality = 0.5f;        // Fertility of soil weathered from this rock
    float water_retention = 0.5f;     // How well the ground holds water
    float elevation_bonus = 0.0f;     // Base uplift (-1..1)
};

struct FormationTemplate {
    std::string type;               // Descriptive tag, e.g. "granite_intrusion"
    int32_t count = 1;
    float min_radius = 20.0f;
    float max_radius = 40.0f;
    RockType rock_type = RockType::Soft;
    float elevation_effect = 0.0f;  // -1..1
};

[[nodiscard]] std::vector<FormationTemplate> default_formation_templates();
[[nodiscard]] std::array<RockProperties, ROCK_TYPE_COUNT> default_rock_properties();

struct GeologyConfig {
    std::vector<FormationTemplate> formations = default_formation_templates();
    std::array<RockProperties, ROCK_TYPE_COUNT> rock_properties = default_rock_properties();
    RockType base_rock_type = RockType::Soft;
    int32_t center_margin = 30;                  // Formation centers keep this far from the edge
    float weathering_effect = 0.3f;              // Soil noise amplitude
    float perturbation_noise_threshold = 0.7f;   // Rock-type perturbation gates
    float perturbation_sample_threshold = 0.8f;

    [[nodiscard]] const RockProperties& properties(RockType type) const {
        return rock_properties[static_cast<size_t>(type)];
    }
};

// ============================================================================
// Formations
// ============================================================================

struct GeologicalFormation {
    uint32_t id = 0;
    std::string type;
    int32_t center_x = 0;
    int32_t center_y = 0;
    float radius = 1.0f;
    RockType rock_type = RockType::Soft;
    float elevation_effect = 0.0f;
    float strength = 1.0f;  // 0.8..1.2

    [[nodiscard]] bool contains(int32_t x, int32_t y) const;

    // (1 - d/r) * strength inside the formation, 0 outside
    [[nodiscard]] float influence_at(int32_t x, int32_t y) const;

    bool operator==(const GeologicalFormation&) const = default;
};

struct GeologyStats {
    size_t formation_count = 0;
    size_t lattice_samples = 0;
    std::array<size_t, ROCK_TYPE_COUNT> rock_counts{};
    float average_soil_quality = 0.0f;
};

// ============================================================================
// Geology Module
// ============================================================================

class GeologyModule final : public TerrainModule {
public:
    static constexpr const char* NAME = "geology";
    static constexpr int PRIORITY = 120;
    static constexpr int32_t LATTICE_STRIDE = 2;

    explicit GeologyModule(const GeologyConfig& config = {});
    ~GeologyModule() override;

    GeologyModule(const GeologyModule&) = delete;
    GeologyModule& operator=(const GeologyModule&) = delete;

    [[nodiscard]] std::string_view get_name() const override { return NAME; }
    [[nodiscard]] int get_priority() const override { return PRIORITY; }
    [[nodiscard]] std::vector<std::string> get_dependencies() const override { return {}; }

    void generate(const WorldContext& context) override;
    [[nodiscard]] ModuleSample get_data_at(int32_t x, int32_t y, const WorldContext& context) const override;
    [[nodiscard]] bool is_generated() const override;

    // ========================================================================
    // Queries
    // ========================================================================

    /// Rock type from the sample lattice: exact point, else nearest lattice
    /// point inside bounds, else the base rock type.
    [[nodiscard]] RockType get_rock_type_at(int32_t x, int32_t y) const;

    /// Evaluate formations and perturbation directly, bypassing the lattice
    [[nodiscard]] RockType determine_rock_type_at(int32_t x, int32_t y) const;

    [[nodiscard]] const RockProperties& get_rock_properties_at(int32_t x, int32_t y) const;
    [[nodiscard]] float get_soil_quality_at(int32_t x, int32_t y) const;
    [[nodiscard]] float get_erosion_resistance_at(int32_t x, int32_t y) const;
    [[nodiscard]] float get_water_retention_at(int32_t x, int32_t y) const;

    /// elevation_bonus of the local rock plus
    /// 0.3 * sum over containing formations of (1 - d/r) * effect * strength
    [[nodiscard]] float get_elevation_influence_at(int32_t x, int32_t y) const;

    [[nodiscard]] const std::vector<GeologicalFormation>& get_formations() const;
    [[nodiscard]] std::vector<const GeologicalFormation*> get_formations_at(int32_t x, int32_t y) const;

    [[nodiscard]] GeologyStats get_stats() const;
    [[nodiscard]] const GeologyConfig& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tileworld::world
