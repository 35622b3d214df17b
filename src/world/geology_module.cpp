// TileWorld World System
// geology_module.cpp - Rock formations, rock-type and soil sample lattices

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <tileworld/core/clock.hpp>
#include <tileworld/core/logger.hpp>
#include <tileworld/world/geology_module.hpp>
#include <tileworld/world/noise.hpp>
#include <tileworld/world/sample_grid.hpp>

namespace tileworld::world {

namespace {

// Sampler channels
constexpr int64_t FORMATION_SALT = 0x474f;
constexpr int64_t PERTURBATION_NOISE_SALT = 12345;
constexpr int64_t SOIL_NOISE_SALT = 54321;
constexpr uint32_t PERTURBATION_GATE_CHANNEL = 1337;
constexpr uint32_t PERTURBATION_PICK_CHANNEL = 1000;

constexpr float PERTURBATION_FREQUENCY = 0.01f;
constexpr float SOIL_FREQUENCY = 0.02f;
constexpr float INFLUENCE_SCALE = 0.3f;

}  // namespace

std::vector<FormationTemplate> default_formation_templates() {
    return {
        {"granite_intrusion", 2, 40.0f, 80.0f, RockType::Hard, 0.6f},
        {"limestone_beds", 3, 30.0f, 60.0f, RockType::Soft, -0.3f},
        {"clay_deposits", 4, 20.0f, 40.0f, RockType::Clay, -0.1f},
    };
}

std::array<RockProperties, ROCK_TYPE_COUNT> default_rock_properties() {
    std::array<RockProperties, ROCK_TYPE_COUNT> props{};
    props[static_cast<size_t>(RockType::Hard)] = {0.9f, 0.2f, 0.1f, 0.4f};
    props[static_cast<size_t>(RockType::Soft)] = {0.3f, 0.8f, 0.4f, -0.2f};
    props[static_cast<size_t>(RockType::Clay)] = {0.5f, 0.6f, 0.9f, -0.1f};
    return props;
}

// ============================================================================
// Formations
// ============================================================================

bool GeologicalFormation::contains(int32_t x, int32_t y) const {
    return euclidean_distance(x, y, center_x, center_y) < radius;
}

float GeologicalFormation::influence_at(int32_t x, int32_t y) const {
    double distance = euclidean_distance(x, y, center_x, center_y);
    if (distance >= radius) {
        return 0.0f;
    }
    return static_cast<float>((1.0 - distance / radius) * strength);
}

// ============================================================================
// Implementation Details
// ============================================================================

struct GeologyModule::Impl {
    GeologyConfig config;
    WorldBounds bounds{};
    int64_t seed = 0;
    bool generated = false;

    std::vector<GeologicalFormation> formations;
    SampleGrid<RockType> rock_grid;
    SampleGrid<float> soil_grid;

    std::unique_ptr<NoiseField> perturbation_noise;
    std::unique_ptr<NoiseField> soil_noise;

    void validate_templates() const {
        for (const auto& tmpl : config.formations) {
            if (tmpl.count < 0) {
                throw ConfigurationError(fmt::format("formation '{}' has negative count {}", tmpl.type, tmpl.count));
            }
            if (tmpl.min_radius <= 0.0f || tmpl.max_radius < tmpl.min_radius) {
                throw ConfigurationError(fmt::format("formation '{}' has invalid radius range [{}, {}]", tmpl.type,
                                                     tmpl.min_radius, tmpl.max_radius));
            }
        }
    }

    // Centers are drawn from seed + index * 1000 with offsets 0/1000/2000/3000
    // for x, y, radius and strength.
    [[nodiscard]] GeologicalFormation create_formation(const FormationTemplate& tmpl, uint32_t index) const {
        const int64_t base = seed + static_cast<int64_t>(index) * 1000;

        const int32_t span_x = bounds.max_x - bounds.min_x;
        const int32_t span_y = bounds.max_y - bounds.min_y;
        const int32_t margin_x = std::min(config.center_margin, span_x / 2);
        const int32_t margin_y = std::min(config.center_margin, span_y / 2);

        GeologicalFormation formation;
        formation.id = index;
        formation.type = tmpl.type;
        formation.center_x = bounds.min_x + margin_x +
                             static_cast<int32_t>(std::floor(random_unit(base, FORMATION_SALT) * (span_x - 2 * margin_x)));
        formation.center_y =
            bounds.min_y + margin_y +
            static_cast<int32_t>(std::floor(random_unit(base + 1000, FORMATION_SALT) * (span_y - 2 * margin_y)));
        formation.radius = static_cast<float>(
            random_between(base + 2000, FORMATION_SALT, tmpl.min_radius, tmpl.max_radius));
        formation.rock_type = tmpl.rock_type;
        formation.elevation_effect = tmpl.elevation_effect;
        formation.strength = static_cast<float>(random_between(base + 3000, FORMATION_SALT, 0.8, 1.2));
        return formation;
    }

    [[nodiscard]] RockType determine_rock_type(int32_t x, int32_t y) const {
        RockType rock = config.base_rock_type;
        float strongest = 0.0f;

        for (const auto& formation : formations) {
            float influence = formation.influence_at(x, y);
            if (influence > strongest) {
                strongest = influence;
                rock = formation.rock_type;
            }
        }

        // Sparse outcrops of a different rock break up large uniform regions
        if (perturbation_noise &&
            perturbation_noise->sample(x, y) > config.perturbation_noise_threshold &&
            random_at(seed, PERTURBATION_GATE_CHANNEL, x, y) > config.perturbation_sample_threshold) {
            auto pick = static_cast<size_t>(random_at(seed, PERTURBATION_PICK_CHANNEL, x, y) * ROCK_TYPE_COUNT);
            rock = static_cast<RockType>(std::min(pick, ROCK_TYPE_COUNT - 1));
        }

        return rock;
    }

    [[nodiscard]] float compute_soil_quality(int32_t x, int32_t y, RockType rock) const {
        float quality = config.properties(rock).soil_quality;
        if (soil_noise) {
            quality += config.weathering_effect * soil_noise->sample(x, y);
        }
        return std::clamp(quality, 0.0f, 1.0f);
    }

    [[nodiscard]] RockType lookup_rock_type(int32_t x, int32_t y) const {
        if (auto index = rock_grid.index_of(x, y)) {
            return rock_grid.at(*index);
        }
        if (auto index = rock_grid.nearest_index(x, y)) {
            return rock_grid.at(*index);
        }
        return config.base_rock_type;
    }
};

// ============================================================================
// Geology Module
// ============================================================================

GeologyModule::GeologyModule(const GeologyConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

GeologyModule::~GeologyModule() = default;

void GeologyModule::generate(const WorldContext& context) {
    TILEWORLD_SCOPED_TIMER(core::log_category::TERRAIN, "Geology generation");

    impl_->validate_templates();

    impl_->bounds = context.get_bounds();
    impl_->seed = context.get_seed();
    impl_->generated = false;

    impl_->perturbation_noise =
        std::make_unique<NoiseField>(impl_->seed, PERTURBATION_NOISE_SALT, NoiseFieldConfig{PERTURBATION_FREQUENCY});
    impl_->soil_noise = std::make_unique<NoiseField>(impl_->seed, SOIL_NOISE_SALT, NoiseFieldConfig{SOIL_FREQUENCY});

    // 1. Formations, indexed globally across templates
    impl_->formations.clear();
    uint32_t index = 0;
    for (const auto& tmpl : impl_->config.formations) {
        for (int32_t i = 0; i < tmpl.count; ++i) {
            impl_->formations.push_back(impl_->create_formation(tmpl, index++));
        }
    }

    // 2. Rock-type lattice
    impl_->rock_grid = SampleGrid<RockType>(impl_->bounds, LATTICE_STRIDE, impl_->config.base_rock_type);
    impl_->rock_grid.for_each([this](const Position& pos, RockType& rock) {
        rock = impl_->determine_rock_type(pos.x, pos.y);
    });

    // 3. Soil-quality lattice, keyed identically
    impl_->soil_grid = SampleGrid<float>(impl_->bounds, LATTICE_STRIDE, 0.0f);
    for (size_t i = 0; i < impl_->soil_grid.size(); ++i) {
        Position pos = impl_->soil_grid.position_of(i);
        impl_->soil_grid.at(i) = impl_->compute_soil_quality(pos.x, pos.y, impl_->rock_grid.at(i));
    }

    impl_->generated = true;

    TILEWORLD_LOG_INFO(core::log_category::TERRAIN, "Geology generated: {} formations, {} lattice samples",
                       impl_->formations.size(), impl_->rock_grid.size());
}

ModuleSample GeologyModule::get_data_at(int32_t x, int32_t y, const WorldContext& /*context*/) const {
    RockType rock = get_rock_type_at(x, y);
    const RockProperties& props = impl_->config.properties(rock);
    float soil = get_soil_quality_at(x, y);

    ModuleSample sample;
    sample.features.push_back(fmt::format("rock-{}", rock_type_to_string(rock)));
    sample.features.push_back(fmt::format("soil-{:.1f}", soil));
    sample.values["erosion_resistance"] = props.erosion_resistance;
    sample.values["water_retention"] = props.water_retention;
    sample.values["soil_quality"] = soil;
    sample.values["elevation_influence"] = get_elevation_influence_at(x, y);
    return sample;
}

bool GeologyModule::is_generated() const {
    return impl_->generated;
}

RockType GeologyModule::get_rock_type_at(int32_t x, int32_t y) const {
    return impl_->lookup_rock_type(x, y);
}

RockType GeologyModule::determine_rock_type_at(int32_t x, int32_t y) const {
    return impl_->determine_rock_type(x, y);
}

const RockProperties& GeologyModule::get_rock_properties_at(int32_t x, int32_t y) const {
    return impl_->config.properties(get_rock_type_at(x, y));
}

float GeologyModule::get_soil_quality_at(int32_t x, int32_t y) const {
    if (auto index = impl_->soil_grid.index_of(x, y)) {
        return impl_->soil_grid.at(*index);
    }
    if (auto index = impl_->soil_grid.nearest_index(x, y)) {
        return impl_->soil_grid.at(*index);
    }
    return impl_->config.properties(impl_->config.base_rock_type).soil_quality;
}

float GeologyModule::get_erosion_resistance_at(int32_t x, int32_t y) const {
    return get_rock_properties_at(x, y).erosion_resistance;
}

float GeologyModule::get_water_retention_at(int32_t x, int32_t y) const {
    return get_rock_properties_at(x, y).water_retention;
}

float GeologyModule::get_elevation_influence_at(int32_t x, int32_t y) const {
    float influence = get_rock_properties_at(x, y).elevation_bonus;

    float formation_sum = 0.0f;
    for (const auto& formation : impl_->formations) {
        float weight = formation.influence_at(x, y);
        if (weight > 0.0f) {
            formation_sum += weight * formation.elevation_effect;
        }
    }
    return influence + INFLUENCE_SCALE * formation_sum;
}

const std::vector<GeologicalFormation>& GeologyModule::get_formations() const {
    return impl_->formations;
}

std::vector<const GeologicalFormation*> GeologyModule::get_formations_at(int32_t x, int32_t y) const {
    std::vector<const GeologicalFormation*> result;
    for (const auto& formation : impl_->formations) {
        if (formation.contains(x, y)) {
            result.push_back(&formation);
        }
    }
    return result;
}

GeologyStats GeologyModule::get_stats() const {
    GeologyStats stats;
    stats.formation_count = impl_->formations.size();
    stats.lattice_samples = impl_->rock_grid.size();

    for (RockType rock : impl_->rock_grid.values()) {
        ++stats.rock_counts[static_cast<size_t>(rock)];
    }

    if (!impl_->soil_grid.empty()) {
        double total = 0.0;
        for (float quality : impl_->soil_grid.values()) {
            total += quality;
        }
        stats.average_soil_quality = static_cast<float>(total / static_cast<double>(impl_->soil_grid.size()));
    }
    return stats;
}

const GeologyConfig& GeologyModule::get_config() const {
    return impl_->config;
}

}  // namespace tileworld::world
