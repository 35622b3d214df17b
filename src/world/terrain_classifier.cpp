// TileWorld World System
// terrain_classifier.cpp - Elevation banding with hysteresis

#include <cmath>
#include <tileworld/world/terrain_classifier.hpp>
#include <tileworld/world/world_generator.hpp>

namespace tileworld::world {

namespace {

constexpr TerrainKind LAND_BANDS[4] = {TerrainKind::Plains, TerrainKind::Forest, TerrainKind::Foothills,
                                       TerrainKind::Mountain};

}  // namespace

TerrainClassifier::TerrainClassifier(const ClassifierConfig& config) : config_(config) {}

TerrainKind TerrainClassifier::classify_elevation(float elevation, float neighborhood_mean) const {
    size_t band = 0;
    for (float threshold : thresholds()) {
        bool above = std::abs(elevation - threshold) < config_.hysteresis ? neighborhood_mean >= threshold
                                                                          : elevation >= threshold;
        if (above) {
            ++band;
        }
    }
    return LAND_BANDS[band];
}

TerrainKind TerrainClassifier::classify(const ModuleSample& merged, float elevation, float neighborhood_mean) const {
    if (merged.terrain) {
        return *merged.terrain;
    }
    return classify_elevation(elevation, neighborhood_mean);
}

TerrainKind TerrainClassifier::classify_at(int32_t x, int32_t y, const WorldGenerator& generator) const {
    ModuleSample merged = generator.sample_at(x, y);
    if (merged.terrain) {
        return *merged.terrain;
    }

    float elevation = generator.get_elevation_at(x, y);
    float mean = elevation;
    if (is_near_threshold(elevation)) {
        float sum = 0.0f;
        for (int32_t dy = -1; dy <= 1; ++dy) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                sum += generator.get_elevation_at(x + dx, y + dy);
            }
        }
        mean = sum / 9.0f;
    }
    return classify_elevation(elevation, mean);
}

bool TerrainClassifier::is_near_threshold(float elevation) const {
    for (float threshold : thresholds()) {
        if (std::abs(elevation - threshold) < config_.hysteresis) {
            return true;
        }
    }
    return false;
}

}  // namespace tileworld::world
