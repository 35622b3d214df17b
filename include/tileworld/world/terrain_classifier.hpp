// TileWorld World System
// terrain_classifier.hpp - Collapses module output to a single terrain kind

#pragma once

#include "terrain_module.hpp"
#include "types.hpp"

#include <array>
#include <cstdint>

namespace tileworld::world {

class WorldGenerator;

struct ClassifierConfig {
    float forest_threshold = 0.28f;
    float foothills_threshold = 0.45f;
    float mountain_threshold = 0.75f;
    float hysteresis = 0.02f;  // Half-width of the band where the 3x3 mean decides

    [[nodiscard]] bool is_valid() const {
        return hysteresis >= 0.0f && forest_threshold < foothills_threshold &&
               foothills_threshold < mountain_threshold;
    }
};

// Pure function of module output: identical inputs always give the same kind.
// Water supplied by a module wins; land is banded by elevation.
class TerrainClassifier {
public:
    explicit TerrainClassifier(const ClassifierConfig& config = {});

    // Elevation bands only; `neighborhood_mean` is consulted inside a hysteresis band
    [[nodiscard]] TerrainKind classify_elevation(float elevation, float neighborhood_mean) const;

    [[nodiscard]] TerrainKind classify(const ModuleSample& merged, float elevation, float neighborhood_mean) const;

    // Samples the generator at (x, y); the 3x3 mean is computed only when needed
    [[nodiscard]] TerrainKind classify_at(int32_t x, int32_t y, const WorldGenerator& generator) const;

    [[nodiscard]] bool is_near_threshold(float elevation) const;

    [[nodiscard]] const ClassifierConfig& get_config() const { return config_; }

private:
    [[nodiscard]] std::array<float, 3> thresholds() const {
        return {config_.forest_threshold, config_.foothills_threshold, config_.mountain_threshold};
    }

    ClassifierConfig config_;
};

}  // namespace tileworld::world
