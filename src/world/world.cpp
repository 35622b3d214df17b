// TileWorld World System
// world.cpp - Lazily materialised tile world over the terrain pipeline

#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <map>
#include <tileworld/core/logger.hpp>
#include <tileworld/world/world.hpp>
#include <unordered_map>

namespace tileworld::world {

using json = nlohmann::json;

namespace {

constexpr float OUT_OF_BOUNDS_ELEVATION = 0.2f;

std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%FT%TZ}", fmt::gmtime(now));
}

}  // namespace

// ============================================================================
// Implementation Details
// ============================================================================

struct World::Impl {
    core::Config& config;
    ModuleRegistry registry;
    TerrainSettings settings;
    WorldGenerator generator;

    TerrainClassifier classifier;
    TerrainTypeTable terrain_types;
    PerformanceConfig performance;
    TreeLayer trees;

    WorldBounds bounds{};
    int64_t seed = 0;
    bool initialized = false;

    mutable std::unordered_map<Position, WorldCell> cells;

    Impl(core::Config& c, ModuleRegistry r)
        : config(c), registry(std::move(r)), settings(config), generator(settings, registry) {}

    void refresh_settings() {
        classifier = TerrainClassifier(settings.get_classifier_config());
        terrain_types = settings.get_terrain_types();
        performance = settings.get_performance_config();
    }

    [[nodiscard]] WorldCell create_cell(int32_t x, int32_t y) const {
        WorldCell cell;
        try {
            cell.terrain = classifier.classify_at(x, y, generator);
            cell.elevation = std::clamp(generator.get_elevation_at(x, y), 0.0f, 1.0f);
            cell.walkable = terrain_types.is_walkable(cell.terrain);
        } catch (const std::exception& e) {
            TILEWORLD_LOG_ERROR(core::log_category::WORLD, "Cell ({}, {}) failed to generate, using plains: {}", x, y,
                                e.what());
            cell = WorldCell{};
        }
        return cell;
    }

    [[nodiscard]] const WorldCell& cell_at(int32_t x, int32_t y) const {
        Position pos{x, y};
        auto it = cells.find(pos);
        if (it == cells.end()) {
            it = cells.emplace(pos, create_cell(x, y)).first;
        }
        return it->second;
    }

    void place_trees() {
        trees.generate(bounds, seed, settings.get_tree_config(),
                       [this](int32_t x, int32_t y) { return cell_at(x, y).terrain; });
    }

    // Everything derived from module output is rebuilt after a commit
    void after_generation() {
        cells.clear();
        refresh_settings();
        bounds = generator.get_context().get_bounds();
        seed = generator.get_context().get_seed();
        initialized = true;
        place_trees();
    }
};

// ============================================================================
// World
// ============================================================================

World::World(core::Config& config, ModuleRegistry registry)
    : impl_(std::make_unique<Impl>(config, std::move(registry))) {
    try {
        impl_->bounds = impl_->settings.get_world_config().bounds;
    } catch (const std::exception& e) {
        TILEWORLD_LOG_WARN(core::log_category::WORLD, "World section unreadable until initialize(): {}", e.what());
    }
}

World::~World() = default;

core::Status World::initialize() {
    if (auto status = impl_->settings.validate(); !status) {
        TILEWORLD_LOG_ERROR(core::log_category::WORLD, "Configuration rejected: {}", status.message());
        return status;
    }
    if (auto status = impl_->generator.initialize(); !status) {
        return status;
    }
    impl_->after_generation();

    TILEWORLD_LOG_INFO(core::log_category::WORLD, "World initialized: x [{}, {}], y [{}, {}], seed {}, {} trees",
                       impl_->bounds.min_x, impl_->bounds.max_x, impl_->bounds.min_y, impl_->bounds.max_y,
                       impl_->seed, impl_->trees.get_tree_count());
    return core::Status::ok();
}

bool World::is_initialized() const {
    return impl_->initialized;
}

// ----------------------------------------------------------------------------
// Cell queries
// ----------------------------------------------------------------------------

TerrainRecord World::get_terrain_at(int32_t x, int32_t y) const {
    TerrainRecord record;
    if (!is_in_bounds(x, y)) {
        record.terrain = TerrainKind::Unknown;
        record.elevation = OUT_OF_BOUNDS_ELEVATION;
        record.discovered = false;
        record.walkable = false;
        return record;
    }

    const WorldCell& cell = impl_->cell_at(x, y);
    record.terrain = cell.terrain;
    record.elevation = cell.elevation;
    record.discovered = cell.discovered;
    record.walkable = cell.walkable;
    record.feature = impl_->trees.get_feature_at(x, y);
    return record;
}

bool World::is_in_bounds(int32_t x, int32_t y) const {
    return impl_->bounds.contains(x, y);
}

bool World::can_move_to(int32_t x, int32_t y) const {
    if (!is_in_bounds(x, y)) {
        return false;
    }
    return impl_->terrain_types.is_walkable(impl_->cell_at(x, y).terrain);
}

bool World::is_passable(int32_t x, int32_t y) const {
    return can_move_to(x, y) && !impl_->trees.has_trunk_at(x, y);
}

std::optional<TileFeature> World::get_feature_at(int32_t x, int32_t y) const {
    return impl_->trees.get_feature_at(x, y);
}

core::Status World::mark_discovered(int32_t x, int32_t y) {
    if (!is_in_bounds(x, y)) {
        return core::Status::error(core::ErrorCode::OutOfBounds,
                                   fmt::format("({}, {}) is outside the world", x, y));
    }
    auto it = impl_->cells.find(Position{x, y});
    if (it != impl_->cells.end()) {
        it->second.discovered = true;
    }
    return core::Status::ok();
}

size_t World::mark_discovered_around(const Position& center, int32_t radius) {
    size_t flipped = 0;
    for (int32_t dy = -radius; dy <= radius; ++dy) {
        for (int32_t dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy > radius * radius) {
                continue;
            }
            auto it = impl_->cells.find(Position{center.x + dx, center.y + dy});
            if (it != impl_->cells.end() && !it->second.discovered) {
                it->second.discovered = true;
                ++flipped;
            }
        }
    }
    return flipped;
}

// ----------------------------------------------------------------------------
// Regeneration and configuration
// ----------------------------------------------------------------------------

core::Status World::regenerate_world() {
    if (auto status = impl_->settings.validate(); !status) {
        return status;
    }
    if (auto status = impl_->generator.regenerate_all(); !status) {
        TILEWORLD_LOG_ERROR(core::log_category::WORLD, "World regeneration failed: {}", status.to_string());
        return status;
    }
    impl_->after_generation();
    TILEWORLD_LOG_INFO(core::log_category::WORLD, "World regenerated");
    return core::Status::ok();
}

core::Status World::regenerate_module(std::string_view name) {
    if (auto status = impl_->generator.regenerate_module(name); !status) {
        TILEWORLD_LOG_ERROR(core::log_category::WORLD, "Regenerating '{}' failed: {}", name, status.to_string());
        return status;
    }
    impl_->after_generation();
    TILEWORLD_LOG_INFO(core::log_category::WORLD, "Module '{}' regenerated, cell cache cleared", name);
    return core::Status::ok();
}

core::Status World::apply_geological_preset(std::string_view name) {
    auto overlay = impl_->settings.get_preset_overlay(preset_group::GEOLOGICAL, name);
    if (!overlay) {
        return core::Status::error(core::ErrorCode::UnknownPreset, fmt::format("no geological preset '{}'", name));
    }
    return update_configuration(core::config_section::GEOLOGY, *overlay);
}

core::Status World::quick_config_elevation(std::string_view method) {
    auto overlay = impl_->settings.get_preset_overlay(preset_group::ELEVATION, method);
    if (!overlay) {
        return core::Status::error(core::ErrorCode::UnknownPreset, fmt::format("no elevation preset '{}'", method));
    }
    return update_configuration(core::config_section::ELEVATION, *overlay);
}

core::Status World::quick_config_water(std::string_view level) {
    auto overlay = impl_->settings.get_preset_overlay(preset_group::WATER, level);
    if (!overlay) {
        return core::Status::error(core::ErrorCode::UnknownPreset, fmt::format("no water preset '{}'", level));
    }
    return update_configuration(core::config_section::HYDROLOGY, *overlay);
}

core::Status World::update_configuration(std::string_view section, const json& values) {
    if (!values.is_object()) {
        return core::Status::error(core::ErrorCode::ConfigurationInvalid,
                                   fmt::format("update for '{}' must be an object", section));
    }

    core::Config& config = impl_->config;
    const json previous = config.section(section);
    config.merge_section(section, values);

    core::Status status = impl_->settings.validate();
    if (!status) {
        // Drop keys the update introduced, then restore the old values
        for (auto it = values.begin(); it != values.end(); ++it) {
            if (!previous.contains(it.key())) {
                config.remove(section, it.key());
            }
        }
        config.merge_section(section, previous);
        TILEWORLD_LOG_WARN(core::log_category::CONFIG, "Rejected update to '{}': {}", section, status.message());
        return status;
    }

    impl_->refresh_settings();
    if (section == core::config_section::TERRAIN_TYPES || section == core::config_section::CLASSIFIER ||
        section == core::config_section::TREES) {
        // Cells carry derived walkability and classification
        impl_->cells.clear();
        if (impl_->initialized) {
            impl_->place_trees();
        }
    }

    TILEWORLD_LOG_INFO(core::log_category::CONFIG, "Updated '{}' ({} keys)", section, values.size());
    return core::Status::ok();
}

// ----------------------------------------------------------------------------
// Reporting
// ----------------------------------------------------------------------------

TerrainStatistics World::get_terrain_statistics(int32_t step) const {
    TerrainStatistics stats;
    stats.sample_step = step > 0 ? step : std::max(1, impl_->performance.statistics_sample_step);

    const WorldBounds& bounds = impl_->bounds;
    for (int32_t y = bounds.min_y; y <= bounds.max_y; y += stats.sample_step) {
        for (int32_t x = bounds.min_x; x <= bounds.max_x; x += stats.sample_step) {
            ++stats.counts[static_cast<size_t>(impl_->cell_at(x, y).terrain)];
            ++stats.total_samples;
        }
    }
    return stats;
}

json World::export_world_state() const {
    std::map<std::string, const WorldCell*> ordered;
    for (const auto& [pos, cell] : impl_->cells) {
        ordered.emplace(position_key(pos.x, pos.y), &cell);
    }

    json cells = json::array();
    for (const auto& [key, cell] : ordered) {
        json entry = {{"terrain", terrain_kind_to_string(cell->terrain)},
                      {"elevation", cell->elevation},
                      {"discovered", cell->discovered},
                      {"walkable", cell->walkable}};
        cells.push_back(json::array({key, std::move(entry)}));
    }

    const WorldBounds& bounds = impl_->bounds;
    json state;
    state["configuration"] = impl_->config.data();
    state["worldBounds"] = {
        {"minX", bounds.min_x}, {"maxX", bounds.max_x}, {"minY", bounds.min_y}, {"maxY", bounds.max_y}};
    state["generatedCells"] = std::move(cells);
    state["timestamp"] = utc_timestamp();
    return state;
}

RenderedCell World::render_cell(int32_t x, int32_t y) const {
    TerrainRecord record = get_terrain_at(x, y);
    const TerrainTypeInfo& info = impl_->terrain_types.get(record.terrain);

    RenderedCell rendered;
    rendered.symbol = info.symbol;
    rendered.style_tag = info.style_tag;
    rendered.display_name = info.display_name;
    rendered.terrain = record.terrain;
    rendered.feature = record.feature;
    rendered.discovered = record.discovered;
    rendered.elevation = record.elevation;
    return rendered;
}

PositionAnalysis World::analyze_position(int32_t x, int32_t y) const {
    return impl_->generator.analyze_position(x, y);
}

// ----------------------------------------------------------------------------
// Accessors
// ----------------------------------------------------------------------------

const WorldBounds& World::get_bounds() const {
    return impl_->bounds;
}

int64_t World::get_seed() const {
    return impl_->seed;
}

const TerrainTypeTable& World::get_terrain_types() const {
    return impl_->terrain_types;
}

const PerformanceConfig& World::get_performance_config() const {
    return impl_->performance;
}

const TerrainSettings& World::get_settings() const {
    return impl_->settings;
}

const WorldGenerator& World::get_generator() const {
    return impl_->generator;
}

const TreeLayer& World::get_trees() const {
    return impl_->trees;
}

size_t World::get_cell_count() const {
    return impl_->cells.size();
}

core::Config& World::get_config() {
    return impl_->config;
}

const core::Config& World::get_config() const {
    return impl_->config;
}

}  // namespace tileworld::world
