// TileWorld World System
// hydrology_module.cpp - Lakes, springs and rivers derived from elevation and geology

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <tileworld/core/clock.hpp>
#include <tileworld/core/logger.hpp>
#include <tileworld/world/elevation_module.hpp>
#include <tileworld/world/geology_module.hpp>
#include <tileworld/world/hydrology_module.hpp>
#include <tileworld/world/noise.hpp>

namespace tileworld::world {

namespace {

constexpr uint32_t LAKE_JITTER_CHANNEL = 7001;
constexpr uint32_t RIVER_JITTER_CHANNEL = 7002;
constexpr int64_t LAKE_RADIUS_SALT = 0x4c414b45;
constexpr int64_t SPRING_SALT = 0x535052;

constexpr float DROP_WEIGHT = 8.0f;
constexpr float FLAT_BONUS = 1.0f;
constexpr float UPHILL_PENALTY = 3.0f;
constexpr float FLAT_TOLERANCE = 0.005f;
constexpr float RIVER_JITTER = 0.05f;
constexpr float CONFLUENCE_PULL = 2.0f;

struct LakeCandidate {
    Position position{0, 0};
    float elevation = 0.0f;
    float score = 0.0f;
};

struct SpringCandidate {
    Position position{0, 0};
    float elevation = 0.0f;
};

}  // namespace

// ============================================================================
// Implementation Details
// ============================================================================

struct HydrologyModule::Impl {
    HydrologyConfig config;
    WorldBounds bounds{};
    int64_t seed = 0;
    bool generated = false;

    const GeologyModule* geology = nullptr;
    const ElevationModule* elevation = nullptr;

    SampleGrid<uint8_t> mask;
    std::vector<River> rivers;
    std::vector<Lake> lakes;
    std::vector<Position> springs;
    HydrologyStats stats;

    [[nodiscard]] WaterBody body_at(int32_t x, int32_t y) const {
        if (auto index = mask.index_of(x, y)) {
            return static_cast<WaterBody>(mask.at(*index));
        }
        return WaterBody::None;
    }

    void set_body(int32_t x, int32_t y, WaterBody body) {
        if (auto index = mask.index_of(x, y)) {
            mask.at(*index) = static_cast<uint8_t>(body);
        }
    }

    // ------------------------------------------------------------------------
    // Lakes
    // ------------------------------------------------------------------------

    [[nodiscard]] bool is_local_minimum(const Position& pos, float height) const {
        const int32_t half = std::max(1, config.lake_sample_step / 2);
        for (const auto& offset : NEIGHBOR_OFFSETS) {
            int32_t nx = pos.x + offset.x * half;
            int32_t ny = pos.y + offset.y * half;
            if (bounds.contains(nx, ny) && elevation->get_elevation_at(nx, ny) < height) {
                return false;
            }
        }
        return true;
    }

    void place_lakes() {
        std::vector<LakeCandidate> candidates;
        const int32_t step = config.lake_sample_step;

        for (int32_t y = bounds.min_y + step / 2; y <= bounds.max_y; y += step) {
            for (int32_t x = bounds.min_x + step / 2; x <= bounds.max_x; x += step) {
                float height = elevation->get_elevation_at(x, y);
                if (height > config.lake_low_elevation_max) {
                    continue;
                }
                if (geology->get_water_retention_at(x, y) < config.lake_retention_min) {
                    continue;
                }
                Position pos{x, y};
                if (!is_local_minimum(pos, height)) {
                    continue;
                }

                float score = (config.lake_low_elevation_max - height) / std::max(config.lake_low_elevation_max, 0.01f);
                RockType rock = geology->get_rock_type_at(x, y);
                if (rock == RockType::Clay) {
                    score += config.lake_clay_preference;
                } else if (rock == RockType::Hard) {
                    score -= config.lake_hard_rock_avoidance;
                }
                float slope = elevation->get_gradient(x, y).magnitude;
                score += 0.5f * (1.0f - std::min(1.0f, slope * 10.0f));
                score += static_cast<float>(random_at(seed, LAKE_JITTER_CHANNEL, x, y)) * 0.1f;

                candidates.push_back({pos, height, score});
            }
        }

        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const LakeCandidate& a, const LakeCandidate& b) { return a.score > b.score; });

        for (const auto& candidate : candidates) {
            if (static_cast<int>(lakes.size()) >= config.lake_count) {
                break;
            }
            bool too_close = std::any_of(lakes.begin(), lakes.end(), [&](const Lake& lake) {
                return euclidean_distance(lake.center, candidate.position) < config.lake_spacing;
            });
            if (too_close) {
                continue;
            }

            Lake lake;
            lake.id = static_cast<uint32_t>(lakes.size()) + 1;
            lake.center = candidate.position;
            lake.radius = random_int(seed + static_cast<int64_t>(lake.id) * 1000, LAKE_RADIUS_SALT,
                                     config.min_lake_radius, config.max_lake_radius);
            lake.elevation = candidate.elevation;
            lake.rock_type = geology->get_rock_type_at(candidate.position.x, candidate.position.y);

            for (int32_t dy = -lake.radius; dy <= lake.radius; ++dy) {
                for (int32_t dx = -lake.radius; dx <= lake.radius; ++dx) {
                    int32_t x = lake.center.x + dx;
                    int32_t y = lake.center.y + dy;
                    if (!bounds.contains(x, y) || dx * dx + dy * dy > lake.radius * lake.radius) {
                        continue;
                    }
                    if (body_at(x, y) != WaterBody::Lake) {
                        set_body(x, y, WaterBody::Lake);
                        ++lake.cell_count;
                    }
                }
            }
            lakes.push_back(lake);
        }
    }

    // ------------------------------------------------------------------------
    // Springs
    // ------------------------------------------------------------------------

    void place_springs() {
        std::vector<SpringCandidate> candidates;
        for (int i = 0; i < config.spring_candidates; ++i) {
            const int64_t base = seed + static_cast<int64_t>(i) * 1000;
            int32_t x = random_int(base, SPRING_SALT, bounds.min_x, bounds.max_x);
            int32_t y = random_int(base + 1000, SPRING_SALT, bounds.min_y, bounds.max_y);
            if (body_at(x, y) != WaterBody::None) {
                continue;
            }
            float height = elevation->get_elevation_at(x, y);
            if (height >= config.spring_elevation_min) {
                candidates.push_back({{x, y}, height});
            }
        }

        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const SpringCandidate& a, const SpringCandidate& b) { return a.elevation > b.elevation; });

        for (const auto& candidate : candidates) {
            if (static_cast<int>(springs.size()) >= config.spring_count) {
                break;
            }
            bool too_close = std::any_of(springs.begin(), springs.end(), [&](const Position& spring) {
                return euclidean_distance(spring, candidate.position) < config.spring_spacing;
            });
            if (!too_close) {
                springs.push_back(candidate.position);
            }
        }
    }

    // ------------------------------------------------------------------------
    // Rivers
    // ------------------------------------------------------------------------

    [[nodiscard]] std::optional<Position> nearest_river_cell(const Position& from) const {
        const int32_t reach = config.confluence_distance;
        std::optional<Position> best;
        double best_distance = 0.0;
        for (int32_t dy = -reach; dy <= reach; ++dy) {
            for (int32_t dx = -reach; dx <= reach; ++dx) {
                Position pos{from.x + dx, from.y + dy};
                if (body_at(pos.x, pos.y) != WaterBody::River) {
                    continue;
                }
                double distance = euclidean_distance(from, pos);
                if (!best || distance < best_distance) {
                    best = pos;
                    best_distance = distance;
                }
            }
        }
        return best;
    }

    [[nodiscard]] float score_step(const Position& from, const Position& to,
                                   const std::optional<Position>& confluence_target) const {
        float drop = elevation->get_elevation_at(from.x, from.y) - elevation->get_elevation_at(to.x, to.y);
        float score = drop * DROP_WEIGHT;
        if (std::abs(drop) < FLAT_TOLERANCE) {
            score += FLAT_BONUS;
        } else if (drop < 0.0f) {
            score -= UPHILL_PENALTY;
        }

        switch (geology->get_rock_type_at(to.x, to.y)) {
            case RockType::Soft:
                score += config.soft_rock_preference;
                break;
            case RockType::Hard:
                score -= config.hard_rock_avoidance;
                break;
            case RockType::Clay:
                score += config.clay_channeling;
                break;
            default:
                break;
        }

        if (confluence_target) {
            double before = euclidean_distance(from, *confluence_target);
            double after = euclidean_distance(to, *confluence_target);
            if (after < before) {
                score += CONFLUENCE_PULL;
            }
        }

        score += static_cast<float>(random_at(seed, RIVER_JITTER_CHANNEL, to.x, to.y)) * RIVER_JITTER;
        return score;
    }

    [[nodiscard]] River trace_river(const Position& source) const {
        River river;
        river.source = source;
        river.path.push_back(source);

        std::unordered_set<Position> visited{source};
        Position current = source;

        while (static_cast<int>(river.path.size()) < config.max_river_length) {
            if (bounds.is_boundary(current.x, current.y)) {
                river.reaches_boundary = true;
                break;
            }

            std::optional<Position> confluence_target;
            if (config.confluence_enabled) {
                confluence_target = nearest_river_cell(current);
            }

            std::optional<Position> best;
            float best_score = 0.0f;
            for (const auto& offset : NEIGHBOR_OFFSETS) {
                Position next = current + offset;
                if (!bounds.contains(next) || visited.count(next) > 0) {
                    continue;
                }
                float score = score_step(current, next, confluence_target);
                if (!best || score > best_score) {
                    best = next;
                    best_score = score;
                }
            }
            if (!best) {
                break;
            }

            WaterBody body = body_at(best->x, best->y);
            if (body == WaterBody::Lake) {
                river.reaches_lake = true;
                break;
            }
            if (body == WaterBody::River) {
                river.joins_river = true;
                break;
            }

            visited.insert(*best);
            river.path.push_back(*best);
            current = *best;
        }
        return river;
    }

    void trace_rivers() {
        for (const auto& spring : springs) {
            if (body_at(spring.x, spring.y) != WaterBody::None) {
                continue;
            }
            River river = trace_river(spring);
            if (static_cast<int>(river.path.size()) < config.min_river_length && !river.reaches_lake &&
                !river.joins_river) {
                ++stats.dropped_rivers;
                continue;
            }

            river.id = static_cast<uint32_t>(rivers.size()) + 1;
            for (const auto& pos : river.path) {
                set_body(pos.x, pos.y, WaterBody::River);
            }
            rivers.push_back(std::move(river));
        }
    }

    void collect_stats() {
        stats.river_count = rivers.size();
        stats.lake_count = lakes.size();
        stats.spring_count = springs.size();
        stats.river_cells = 0;
        stats.lake_cells = 0;
        for (uint8_t value : mask.values()) {
            if (value == static_cast<uint8_t>(WaterBody::River)) {
                ++stats.river_cells;
            } else if (value == static_cast<uint8_t>(WaterBody::Lake)) {
                ++stats.lake_cells;
            }
        }
        stats.rivers_reaching_lake = static_cast<size_t>(
            std::count_if(rivers.begin(), rivers.end(), [](const River& r) { return r.reaches_lake; }));
        stats.confluences = static_cast<size_t>(
            std::count_if(rivers.begin(), rivers.end(), [](const River& r) { return r.joins_river; }));
    }
};

// ============================================================================
// Hydrology Module
// ============================================================================

HydrologyModule::HydrologyModule(const HydrologyConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

HydrologyModule::~HydrologyModule() = default;

std::vector<std::string> HydrologyModule::get_dependencies() const {
    return {GeologyModule::NAME, ElevationModule::NAME};
}

void HydrologyModule::generate(const WorldContext& context) {
    TILEWORLD_SCOPED_TIMER(core::log_category::TERRAIN, "Hydrology generation");

    const auto& config = impl_->config;
    if (config.min_lake_radius <= 0 || config.max_lake_radius < config.min_lake_radius) {
        throw ConfigurationError(
            fmt::format("invalid lake radius range [{}, {}]", config.min_lake_radius, config.max_lake_radius));
    }
    if (config.lake_sample_step <= 0) {
        throw ConfigurationError("lake sample step must be positive");
    }
    if (config.spring_count < 0 || config.lake_count < 0 || config.spring_candidates < 0) {
        throw ConfigurationError("spring, candidate and lake counts must be non-negative");
    }
    if (config.max_river_length < 1 || config.confluence_distance < 0) {
        throw ConfigurationError("river length and confluence distance must be positive");
    }

    impl_->geology = context.find_module_as<GeologyModule>(GeologyModule::NAME);
    impl_->elevation = context.find_module_as<ElevationModule>(ElevationModule::NAME);
    if (impl_->geology == nullptr || impl_->elevation == nullptr || !impl_->geology->is_generated() ||
        !impl_->elevation->is_generated()) {
        throw std::runtime_error("geology and elevation must be generated before hydrology");
    }

    impl_->bounds = context.get_bounds();
    impl_->seed = context.get_seed();
    impl_->generated = false;
    impl_->mask = SampleGrid<uint8_t>(impl_->bounds, 1, static_cast<uint8_t>(WaterBody::None));
    impl_->rivers.clear();
    impl_->lakes.clear();
    impl_->springs.clear();
    impl_->stats = {};

    impl_->place_lakes();
    impl_->place_springs();
    impl_->trace_rivers();
    impl_->collect_stats();
    impl_->generated = true;

    TILEWORLD_LOG_INFO(core::log_category::TERRAIN, "Hydrology generated: {} lakes, {} springs, {} rivers ({} dropped)",
                       impl_->stats.lake_count, impl_->stats.spring_count, impl_->stats.river_count,
                       impl_->stats.dropped_rivers);
}

ModuleSample HydrologyModule::get_data_at(int32_t x, int32_t y, const WorldContext& /*context*/) const {
    ModuleSample sample;
    switch (get_water_body_at(x, y)) {
        case WaterBody::Lake:
            sample.terrain = TerrainKind::Lake;
            sample.features.emplace_back("lake");
            break;
        case WaterBody::River:
            sample.terrain = TerrainKind::River;
            sample.features.emplace_back("river");
            break;
        default:
            break;
    }
    float moisture = get_moisture_at(x, y);
    sample.features.push_back(fmt::format("moisture-{:.1f}", moisture));
    sample.values["moisture"] = moisture;
    return sample;
}

bool HydrologyModule::is_generated() const {
    return impl_->generated;
}

WaterBody HydrologyModule::get_water_body_at(int32_t x, int32_t y) const {
    return impl_->body_at(x, y);
}

bool HydrologyModule::is_water_at(int32_t x, int32_t y) const {
    return impl_->body_at(x, y) != WaterBody::None;
}

bool HydrologyModule::is_in_lake(int32_t x, int32_t y) const {
    return impl_->body_at(x, y) == WaterBody::Lake;
}

bool HydrologyModule::is_on_river(int32_t x, int32_t y) const {
    return impl_->body_at(x, y) == WaterBody::River;
}

std::optional<int32_t> HydrologyModule::get_distance_to_water(int32_t x, int32_t y, int32_t max_distance) const {
    for (int32_t ring = 0; ring <= max_distance; ++ring) {
        for (int32_t dy = -ring; dy <= ring; ++dy) {
            for (int32_t dx = -ring; dx <= ring; ++dx) {
                if (std::max(std::abs(dx), std::abs(dy)) != ring) {
                    continue;
                }
                if (is_water_at(x + dx, y + dy)) {
                    return ring;
                }
            }
        }
    }
    return std::nullopt;
}

float HydrologyModule::get_moisture_at(int32_t x, int32_t y) const {
    auto distance = get_distance_to_water(x, y, 10);
    if (!distance) {
        return 0.2f;
    }
    if (*distance == 0) {
        return 1.0f;
    }
    if (*distance <= 2) {
        return 0.8f;
    }
    if (*distance <= 5) {
        return 0.6f;
    }
    return 0.4f;
}

const std::vector<River>& HydrologyModule::get_rivers() const {
    return impl_->rivers;
}

const std::vector<Lake>& HydrologyModule::get_lakes() const {
    return impl_->lakes;
}

const std::vector<Position>& HydrologyModule::get_springs() const {
    return impl_->springs;
}

HydrologyStats HydrologyModule::get_stats() const {
    return impl_->stats;
}

const HydrologyConfig& HydrologyModule::get_config() const {
    return impl_->config;
}

}  // namespace tileworld::world
