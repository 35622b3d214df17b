// TileWorld World System
// elevation_module.hpp - Normalised elevation field driven by geology

#pragma once

#include "terrain_module.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tileworld::world {

// ============================================================================
// Elevation Configuration
// ============================================================================

struct ElevationConfig {
    bool use_geology = true;            // false = seeded fallback hills, no dependency
    float geological_strength = 0.7f;   // Weight of geology's elevation influence
    float base_elevation = 0.2f;        // Sea level
    float max_elevation = 1.0f;
    float erosion_strength = 0.3f;      // Soft rock is lowered by (1 - resistance) * this * 0.2
    float noise_amount = 0.05f;         // Amplitude of the fBm detail
    float noise_frequency = 0.02f;
    int noise_octaves = 3;
    int smoothing_passes = 2;           // 5-point averaging passes

    // Fallback hills
    int hill_count = 6;
    float min_hill_radius = 20.0f;
    float max_hill_radius = 35.0f;
    float min_hill_height = 0.25f;
    float max_hill_height = 0.45f;
};

struct ElevationGradient {
    float dx = 0.0f;
    float dy = 0.0f;
    float magnitude = 0.0f;
};

// ============================================================================
// Elevation Module
// ============================================================================

class ElevationModule final : public TerrainModule {
public:
    static constexpr const char* NAME = "elevation";
    static constexpr int PRIORITY = 110;
    static constexpr float MIN_ELEVATION = 0.05f;
    static constexpr float HILLY_THRESHOLD = 0.35f;
    static constexpr float FLAT_GRADIENT = 0.05f;

    explicit ElevationModule(const ElevationConfig& config = {});
    ~ElevationModule() override;

    ElevationModule(const ElevationModule&) = delete;
    ElevationModule& operator=(const ElevationModule&) = delete;

    [[nodiscard]] std::string_view get_name() const override { return NAME; }
    [[nodiscard]] int get_priority() const override { return PRIORITY; }
    [[nodiscard]] std::vector<std::string> get_dependencies() const override;

    void generate(const WorldContext& context) override;
    [[nodiscard]] ModuleSample get_data_at(int32_t x, int32_t y, const WorldContext& context) const override;
    [[nodiscard]] bool is_generated() const override;

    /// Elevation in [0, 1]. Materialised inside bounds; computed on demand
    /// (without smoothing) outside.
    [[nodiscard]] float get_elevation_at(int32_t x, int32_t y) const;

    // Forward differences towards east and north
    [[nodiscard]] ElevationGradient get_gradient(int32_t x, int32_t y, int32_t step = 1) const;

    [[nodiscard]] bool is_hilly(int32_t x, int32_t y) const;
    [[nodiscard]] bool is_flat(int32_t x, int32_t y) const;

    [[nodiscard]] bool is_using_geology() const;
    [[nodiscard]] const ElevationConfig& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tileworld::world
