// TileWorld World System
// elevation_module.cpp - Normalised elevation field driven by geology

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <tileworld/core/clock.hpp>
#include <tileworld/core/logger.hpp>
#include <tileworld/world/elevation_module.hpp>
#include <tileworld/world/geology_module.hpp>
#include <tileworld/world/noise.hpp>
#include <tileworld/world/sample_grid.hpp>

namespace tileworld::world {

namespace {

constexpr int64_t DETAIL_NOISE_SALT = 0x454c;
constexpr int64_t HILL_SALT = 0x48494c;
constexpr float EROSION_SCALE = 0.2f;

struct Hill {
    int32_t x = 0;
    int32_t y = 0;
    float radius = 1.0f;
    float height = 0.0f;
};

float smooth_step(float t) {
    return t * t * (3.0f - 2.0f * t);
}

}  // namespace

// ============================================================================
// Implementation Details
// ============================================================================

struct ElevationModule::Impl {
    ElevationConfig config;
    WorldBounds bounds{};
    int64_t seed = 0;
    bool generated = false;

    const GeologyModule* geology = nullptr;
    std::unique_ptr<NoiseField> detail_noise;
    std::vector<Hill> hills;
    SampleGrid<float> field;

    void place_hills() {
        hills.clear();
        const double span_x = bounds.max_x - bounds.min_x;
        const double span_y = bounds.max_y - bounds.min_y;
        for (int i = 0; i < config.hill_count; ++i) {
            const int64_t base = seed + static_cast<int64_t>(i) * 1000;
            Hill hill;
            hill.x = bounds.min_x + static_cast<int32_t>(std::floor(random_unit(base, HILL_SALT) * span_x));
            hill.y = bounds.min_y + static_cast<int32_t>(std::floor(random_unit(base + 1000, HILL_SALT) * span_y));
            hill.radius = static_cast<float>(
                random_between(base + 2000, HILL_SALT, config.min_hill_radius, config.max_hill_radius));
            hill.height = static_cast<float>(
                random_between(base + 3000, HILL_SALT, config.min_hill_height, config.max_hill_height));
            hills.push_back(hill);
        }
    }

    [[nodiscard]] float detail(int32_t x, int32_t y) const {
        return detail_noise ? detail_noise->sample(x, y) * config.noise_amount : 0.0f;
    }

    [[nodiscard]] float geological_elevation(int32_t x, int32_t y) const {
        float elevation = config.base_elevation;
        elevation += geology->get_elevation_influence_at(x, y) * config.geological_strength;

        // Hard rock resists erosion, soft rock is worn down
        float erosion = (1.0f - geology->get_erosion_resistance_at(x, y)) * config.erosion_strength;
        elevation -= erosion * EROSION_SCALE;

        return elevation + detail(x, y);
    }

    [[nodiscard]] float hill_elevation(int32_t x, int32_t y) const {
        float elevation = config.base_elevation;
        for (const auto& hill : hills) {
            double distance = euclidean_distance(x, y, hill.x, hill.y);
            if (distance < hill.radius) {
                float influence = smooth_step(static_cast<float>(1.0 - distance / hill.radius));
                elevation = std::max(elevation, config.base_elevation + hill.height * influence);
            }
        }
        return elevation + detail(x, y);
    }

    [[nodiscard]] float compute_raw(int32_t x, int32_t y) const {
        float elevation = geology != nullptr ? geological_elevation(x, y) : hill_elevation(x, y);
        elevation = std::clamp(elevation, MIN_ELEVATION, std::max(MIN_ELEVATION, config.max_elevation));
        return std::clamp(elevation, 0.0f, 1.0f);
    }

    void smooth(int passes) {
        if (field.empty()) {
            return;
        }
        const int32_t columns = field.columns();
        const int32_t rows = field.rows();

        for (int pass = 0; pass < passes; ++pass) {
            std::vector<float> next(field.size());
            for (int32_t row = 0; row < rows; ++row) {
                for (int32_t column = 0; column < columns; ++column) {
                    // Edge cells average only the neighbours that exist
                    float sum = 0.0f;
                    int count = 0;
                    auto accumulate = [&](int32_t c, int32_t r) {
                        if (c >= 0 && c < columns && r >= 0 && r < rows) {
                            sum += field.at(static_cast<size_t>(r) * columns + c);
                            ++count;
                        }
                    };
                    accumulate(column, row);
                    accumulate(column - 1, row);
                    accumulate(column + 1, row);
                    accumulate(column, row - 1);
                    accumulate(column, row + 1);
                    next[static_cast<size_t>(row) * columns + column] = sum / static_cast<float>(count);
                }
            }
            for (size_t i = 0; i < next.size(); ++i) {
                field.at(i) = next[i];
            }
        }
    }
};

// ============================================================================
// Elevation Module
// ============================================================================

ElevationModule::ElevationModule(const ElevationConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

ElevationModule::~ElevationModule() = default;

std::vector<std::string> ElevationModule::get_dependencies() const {
    if (impl_->config.use_geology) {
        return {GeologyModule::NAME};
    }
    return {};
}

void ElevationModule::generate(const WorldContext& context) {
    TILEWORLD_SCOPED_TIMER(core::log_category::TERRAIN, "Elevation generation");

    const auto& config = impl_->config;
    if (config.base_elevation < 0.0f || config.base_elevation > 1.0f) {
        throw ConfigurationError(fmt::format("base elevation {} outside [0, 1]", config.base_elevation));
    }
    if (config.smoothing_passes < 0 || config.noise_octaves < 1) {
        throw ConfigurationError("smoothing passes and noise octaves must be non-negative and positive");
    }
    if (!config.use_geology &&
        (config.min_hill_radius <= 0.0f || config.max_hill_radius < config.min_hill_radius)) {
        throw ConfigurationError(fmt::format("invalid hill radius range [{}, {}]", config.min_hill_radius,
                                             config.max_hill_radius));
    }

    impl_->bounds = context.get_bounds();
    impl_->seed = context.get_seed();
    impl_->generated = false;

    impl_->geology = nullptr;
    if (config.use_geology) {
        impl_->geology = context.find_module_as<GeologyModule>(GeologyModule::NAME);
        if (impl_->geology == nullptr || !impl_->geology->is_generated()) {
            throw std::runtime_error("geology module is not available");
        }
    } else {
        impl_->place_hills();
    }

    NoiseFieldConfig noise_config;
    noise_config.frequency = config.noise_frequency;
    noise_config.octaves = config.noise_octaves;
    impl_->detail_noise = std::make_unique<NoiseField>(impl_->seed, DETAIL_NOISE_SALT, noise_config);

    impl_->field = SampleGrid<float>(impl_->bounds, 1, config.base_elevation);
    impl_->field.for_each([this](const Position& pos, float& elevation) {
        elevation = impl_->compute_raw(pos.x, pos.y);
    });
    impl_->smooth(config.smoothing_passes);

    impl_->generated = true;

    TILEWORLD_LOG_INFO(core::log_category::TERRAIN, "Elevation generated ({}), {} samples, {} smoothing passes",
                       impl_->geology != nullptr ? "geological" : "fallback hills", impl_->field.size(),
                       config.smoothing_passes);
}

ModuleSample ElevationModule::get_data_at(int32_t x, int32_t y, const WorldContext& /*context*/) const {
    float elevation = get_elevation_at(x, y);
    ElevationGradient gradient = get_gradient(x, y);

    ModuleSample sample;
    sample.features.push_back(fmt::format("elevation-{:.2f}", elevation));
    if (is_hilly(x, y)) {
        sample.features.emplace_back("hilly");
    }
    sample.values["elevation"] = elevation;
    sample.values["slope"] = gradient.magnitude;
    return sample;
}

bool ElevationModule::is_generated() const {
    return impl_->generated;
}

float ElevationModule::get_elevation_at(int32_t x, int32_t y) const {
    if (auto index = impl_->field.index_of(x, y)) {
        return impl_->field.at(*index);
    }
    if (!impl_->generated) {
        return impl_->config.base_elevation;
    }
    return impl_->compute_raw(x, y);
}

ElevationGradient ElevationModule::get_gradient(int32_t x, int32_t y, int32_t step) const {
    float center = get_elevation_at(x, y);
    float east = get_elevation_at(x + step, y);
    float north = get_elevation_at(x, y - step);

    ElevationGradient gradient;
    gradient.dx = east - center;
    gradient.dy = center - north;
    gradient.magnitude = std::sqrt(gradient.dx * gradient.dx + gradient.dy * gradient.dy);
    return gradient;
}

bool ElevationModule::is_hilly(int32_t x, int32_t y) const {
    return get_elevation_at(x, y) > HILLY_THRESHOLD;
}

bool ElevationModule::is_flat(int32_t x, int32_t y) const {
    return get_gradient(x, y).magnitude < FLAT_GRADIENT;
}

bool ElevationModule::is_using_geology() const {
    return impl_->geology != nullptr;
}

const ElevationConfig& ElevationModule::get_config() const {
    return impl_->config;
}

}  // namespace tileworld::world
