// TileWorld World System
// terrain_settings.cpp - Section parsing, presets and validation

#include <spdlog/fmt/fmt.h>

#include <cctype>

#include <tileworld/world/terrain_settings.hpp>

namespace tileworld::world {

using json = nlohmann::json;

namespace {

RockType parse_rock_type(const json& value, RockType fallback) {
    if (value.is_null()) {
        return fallback;
    }
    auto name = value.get<std::string>();
    auto type = rock_type_from_string(name);
    if (!type) {
        throw ConfigurationError(fmt::format("unknown rock type '{}'", name));
    }
    return *type;
}

const json& member_or_null(const json& object, const char* key) {
    static const json null_value;
    if (!object.is_object()) {
        return null_value;
    }
    auto it = object.find(key);
    return it != object.end() ? *it : null_value;
}

// Shallow overlay of `overlay`'s keys onto a copy of `section`
json overlay_section(const json& section, const json& overlay) {
    json merged = section.is_object() ? section : json::object();
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        merged[it.key()] = it.value();
    }
    return merged;
}

core::Status invalid(std::string message) {
    return core::Status::error(core::ErrorCode::ConfigurationInvalid, std::move(message));
}

}  // namespace

// ============================================================================
// Section Parsers
// ============================================================================

GeologyConfig parse_geology_config(const json& section) {
    GeologyConfig config;

    const json& formations = member_or_null(section, "formations");
    if (formations.is_array()) {
        config.formations.clear();
        for (const auto& entry : formations) {
            FormationTemplate formation;
            formation.type = entry.value("type", std::string("formation"));
            formation.count = entry.value("count", formation.count);
            formation.min_radius = entry.value("min_radius", formation.min_radius);
            formation.max_radius = entry.value("max_radius", formation.max_radius);
            formation.rock_type = parse_rock_type(member_or_null(entry, "rock_type"), formation.rock_type);
            formation.elevation_effect = entry.value("elevation_effect", formation.elevation_effect);
            config.formations.push_back(std::move(formation));
        }
    }

    const json& properties = member_or_null(section, "rock_properties");
    if (properties.is_object()) {
        for (size_t i = 0; i < ROCK_TYPE_COUNT; ++i) {
            auto type = static_cast<RockType>(i);
            const json& entry = member_or_null(properties, rock_type_to_string(type));
            if (!entry.is_object()) {
                continue;
            }
            RockProperties& props = config.rock_properties[i];
            props.erosion_resistance = entry.value("erosion_resistance", props.erosion_resistance);
            props.soil_quality = entry.value("soil_quality", props.soil_quality);
            props.water_retention = entry.value("water_retention", props.water_retention);
            props.elevation_bonus = entry.value("elevation_bonus", props.elevation_bonus);
        }
    }

    config.base_rock_type = parse_rock_type(member_or_null(section, "base_rock_type"), config.base_rock_type);
    if (section.is_object()) {
        config.center_margin = section.value("center_margin", config.center_margin);
        config.weathering_effect = section.value("weathering_effect", config.weathering_effect);
        config.perturbation_noise_threshold =
            section.value("perturbation_noise_threshold", config.perturbation_noise_threshold);
        config.perturbation_sample_threshold =
            section.value("perturbation_sample_threshold", config.perturbation_sample_threshold);
    }
    return config;
}

ElevationConfig parse_elevation_config(const json& section) {
    ElevationConfig config;
    if (!section.is_object()) {
        return config;
    }
    config.use_geology = section.value("use_geology", config.use_geology);
    config.geological_strength = section.value("geological_strength", config.geological_strength);
    config.base_elevation = section.value("base_elevation", config.base_elevation);
    config.max_elevation = section.value("max_elevation", config.max_elevation);
    config.erosion_strength = section.value("erosion_strength", config.erosion_strength);
    config.noise_amount = section.value("noise_amount", config.noise_amount);
    config.noise_frequency = section.value("noise_frequency", config.noise_frequency);
    config.noise_octaves = section.value("noise_octaves", config.noise_octaves);
    config.smoothing_passes = section.value("smoothing_passes", config.smoothing_passes);
    config.hill_count = section.value("hill_count", config.hill_count);
    config.min_hill_radius = section.value("min_hill_radius", config.min_hill_radius);
    config.max_hill_radius = section.value("max_hill_radius", config.max_hill_radius);
    config.min_hill_height = section.value("min_hill_height", config.min_hill_height);
    config.max_hill_height = section.value("max_hill_height", config.max_hill_height);
    return config;
}

HydrologyConfig parse_hydrology_config(const json& section) {
    HydrologyConfig config;
    if (!section.is_object()) {
        return config;
    }
    config.spring_count = section.value("spring_count", config.spring_count);
    config.spring_elevation_min = section.value("spring_elevation_min", config.spring_elevation_min);
    config.spring_spacing = section.value("spring_spacing", config.spring_spacing);
    config.spring_candidates = section.value("spring_candidates", config.spring_candidates);
    config.max_river_length = section.value("max_river_length", config.max_river_length);
    config.min_river_length = section.value("min_river_length", config.min_river_length);
    config.hard_rock_avoidance = section.value("hard_rock_avoidance", config.hard_rock_avoidance);
    config.soft_rock_preference = section.value("soft_rock_preference", config.soft_rock_preference);
    config.clay_channeling = section.value("clay_channeling", config.clay_channeling);
    config.confluence_enabled = section.value("confluence_enabled", config.confluence_enabled);
    config.confluence_distance = section.value("confluence_distance", config.confluence_distance);
    config.lake_count = section.value("lake_count", config.lake_count);
    config.min_lake_radius = section.value("min_lake_radius", config.min_lake_radius);
    config.max_lake_radius = section.value("max_lake_radius", config.max_lake_radius);
    config.lake_spacing = section.value("lake_spacing", config.lake_spacing);
    config.lake_sample_step = section.value("lake_sample_step", config.lake_sample_step);
    config.lake_low_elevation_max = section.value("lake_low_elevation_max", config.lake_low_elevation_max);
    config.lake_retention_min = section.value("lake_retention_min", config.lake_retention_min);
    config.lake_clay_preference = section.value("lake_clay_preference", config.lake_clay_preference);
    config.lake_hard_rock_avoidance = section.value("lake_hard_rock_avoidance", config.lake_hard_rock_avoidance);
    return config;
}

// ============================================================================
// Terrain Type Table
// ============================================================================

TerrainTypeTable::TerrainTypeTable() {
    for (size_t i = 0; i < TERRAIN_KIND_COUNT; ++i) {
        auto kind = static_cast<TerrainKind>(i);
        TerrainTypeInfo& info = types_[i];
        info.display_name = terrain_kind_to_string(kind);
        if (!info.display_name.empty()) {
            info.display_name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(info.display_name[0])));
        }
        info.style_tag = std::string("terrain-") + terrain_kind_to_string(kind);
        info.walkable = !is_water(kind) && kind != TerrainKind::Unknown;
    }
}

// ============================================================================
// Terrain Settings
// ============================================================================

TerrainSettings::TerrainSettings(const core::Config& config) : config_(config) {}

WorldConfig TerrainSettings::get_world_config() const {
    const json& section = config_.section(core::config_section::WORLD);
    WorldConfig world;
    world.bounds.min_x = section.value(core::config_key::MIN_X, world.bounds.min_x);
    world.bounds.max_x = section.value(core::config_key::MAX_X, world.bounds.max_x);
    world.bounds.min_y = section.value(core::config_key::MIN_Y, world.bounds.min_y);
    world.bounds.max_y = section.value(core::config_key::MAX_Y, world.bounds.max_y);
    world.seed = section.value(core::config_key::SEED, world.seed);

    const json& modules = member_or_null(section, core::config_key::MODULES);
    if (modules.is_array()) {
        world.modules = modules.get<std::vector<std::string>>();
    }
    return world;
}

GeologyConfig TerrainSettings::get_geology_config() const {
    return parse_geology_config(config_.section(core::config_section::GEOLOGY));
}

ElevationConfig TerrainSettings::get_elevation_config() const {
    return parse_elevation_config(config_.section(core::config_section::ELEVATION));
}

HydrologyConfig TerrainSettings::get_hydrology_config() const {
    return parse_hydrology_config(config_.section(core::config_section::HYDROLOGY));
}

ClassifierConfig TerrainSettings::get_classifier_config() const {
    const json& section = config_.section(core::config_section::CLASSIFIER);
    ClassifierConfig config;
    config.forest_threshold = section.value("forest_threshold", config.forest_threshold);
    config.foothills_threshold = section.value("foothills_threshold", config.foothills_threshold);
    config.mountain_threshold = section.value("mountain_threshold", config.mountain_threshold);
    config.hysteresis = section.value("hysteresis", config.hysteresis);
    return config;
}

TreeConfig TerrainSettings::get_tree_config() const {
    const json& section = config_.section(core::config_section::TREES);
    TreeConfig config;
    config.enabled = section.value("enabled", config.enabled);
    config.forest_patch_count = section.value("forest_patch_count", config.forest_patch_count);
    config.min_patch_radius = section.value("min_patch_radius", config.min_patch_radius);
    config.max_patch_radius = section.value("max_patch_radius", config.max_patch_radius);
    config.patch_density = section.value("patch_density", config.patch_density);
    config.scattered_tree_count = section.value("scattered_tree_count", config.scattered_tree_count);
    config.max_trees = section.value("max_trees", config.max_trees);
    config.min_tree_spacing = section.value("min_tree_spacing", config.min_tree_spacing);
    config.boundary_margin = section.value("boundary_margin", config.boundary_margin);
    return config;
}

TerrainTypeTable TerrainSettings::get_terrain_types() const {
    const json& section = config_.section(core::config_section::TERRAIN_TYPES);
    TerrainTypeTable table;
    for (size_t i = 0; i < TERRAIN_KIND_COUNT; ++i) {
        auto kind = static_cast<TerrainKind>(i);
        const json& entry = member_or_null(section, terrain_kind_to_string(kind));
        if (!entry.is_object()) {
            continue;
        }
        TerrainTypeInfo info = table.get(kind);
        info.symbol = entry.value("symbol", info.symbol);
        info.style_tag = entry.value("style_tag", info.style_tag);
        info.display_name = entry.value("name", info.display_name);
        info.walkable = entry.value("walkable", info.walkable);
        table.set(kind, std::move(info));
    }
    return table;
}

PerformanceConfig TerrainSettings::get_performance_config() const {
    const json& section = config_.section(core::config_section::PERFORMANCE);
    PerformanceConfig config;
    config.deer_update_interval_ms =
        section.value(core::config_key::DEER_UPDATE_INTERVAL_MS, config.deer_update_interval_ms);
    config.companion_update_interval_ms =
        section.value(core::config_key::COMPANION_UPDATE_INTERVAL_MS, config.companion_update_interval_ms);
    config.statistics_sample_step =
        section.value(core::config_key::STATISTICS_SAMPLE_STEP, config.statistics_sample_step);
    config.exploration_radius = section.value("exploration_radius", config.exploration_radius);
    config.max_catch_up_ticks = section.value("max_catch_up_ticks", config.max_catch_up_ticks);
    config.max_cached_samples = section.value("max_cached_samples", config.max_cached_samples);
    return config;
}

// ============================================================================
// Presets
// ============================================================================

std::optional<json> TerrainSettings::get_preset_overlay(std::string_view group, std::string_view name) const {
    const json& presets = config_.section(core::config_section::PRESETS);
    auto group_it = presets.find(std::string(group));
    if (group_it == presets.end() || !group_it->is_object()) {
        return std::nullopt;
    }
    auto preset_it = group_it->find(std::string(name));
    if (preset_it == group_it->end() || !preset_it->is_object()) {
        return std::nullopt;
    }
    return *preset_it;
}

std::vector<std::string> TerrainSettings::get_preset_names(std::string_view group) const {
    std::vector<std::string> names;
    const json& presets = config_.section(core::config_section::PRESETS);
    auto group_it = presets.find(std::string(group));
    if (group_it != presets.end() && group_it->is_object()) {
        for (auto it = group_it->begin(); it != group_it->end(); ++it) {
            names.push_back(it.key());
        }
    }
    return names;
}

std::optional<ElevationConfig> TerrainSettings::get_elevation_preset(std::string_view name) const {
    auto overlay = get_preset_overlay(preset_group::ELEVATION, name);
    if (!overlay) {
        return std::nullopt;
    }
    return parse_elevation_config(overlay_section(config_.section(core::config_section::ELEVATION), *overlay));
}

std::optional<HydrologyConfig> TerrainSettings::get_water_preset(std::string_view level) const {
    auto overlay = get_preset_overlay(preset_group::WATER, level);
    if (!overlay) {
        return std::nullopt;
    }
    return parse_hydrology_config(overlay_section(config_.section(core::config_section::HYDROLOGY), *overlay));
}

std::optional<GeologyConfig> TerrainSettings::get_geological_preset(std::string_view name) const {
    auto overlay = get_preset_overlay(preset_group::GEOLOGICAL, name);
    if (!overlay) {
        return std::nullopt;
    }
    return parse_geology_config(overlay_section(config_.section(core::config_section::GEOLOGY), *overlay));
}

// ============================================================================
// Validation
// ============================================================================

core::Status TerrainSettings::validate() const {
    for (const char* required : {core::config_section::WORLD, core::config_section::TERRAIN_TYPES,
                                 core::config_section::GEOLOGY, core::config_section::ELEVATION,
                                 core::config_section::HYDROLOGY}) {
        if (!config_.has_section(required)) {
            return invalid(fmt::format("missing required section '{}'", required));
        }
    }

    try {
        WorldConfig world = get_world_config();
        if (!world.bounds.is_valid()) {
            return invalid(fmt::format("world bounds are empty: x [{}, {}], y [{}, {}]", world.bounds.min_x,
                                       world.bounds.max_x, world.bounds.min_y, world.bounds.max_y));
        }
        if (world.modules.empty()) {
            return invalid("world.modules lists no terrain modules");
        }

        GeologyConfig geology = get_geology_config();
        for (const auto& formation : geology.formations) {
            if (formation.count < 0 || formation.min_radius <= 0.0f || formation.max_radius < formation.min_radius) {
                return invalid(fmt::format("formation '{}' has count {} and radius range [{}, {}]", formation.type,
                                           formation.count, formation.min_radius, formation.max_radius));
            }
        }

        ElevationConfig elevation = get_elevation_config();
        if (elevation.base_elevation < 0.0f || elevation.base_elevation > 1.0f) {
            return invalid(fmt::format("base elevation {} outside [0, 1]", elevation.base_elevation));
        }
        if (elevation.min_hill_radius <= 0.0f || elevation.max_hill_radius < elevation.min_hill_radius) {
            return invalid("hill radius range is empty");
        }

        HydrologyConfig hydrology = get_hydrology_config();
        if (hydrology.min_lake_radius <= 0 || hydrology.max_lake_radius < hydrology.min_lake_radius) {
            return invalid(fmt::format("lake radius range [{}, {}] is empty", hydrology.min_lake_radius,
                                       hydrology.max_lake_radius));
        }
        if (hydrology.lake_sample_step <= 0) {
            return invalid("hydrology.lake_sample_step must be positive");
        }

        if (!get_classifier_config().is_valid()) {
            return invalid("classifier thresholds must be strictly increasing");
        }

        TerrainTypeTable types = get_terrain_types();
        for (size_t i = 0; i < TERRAIN_KIND_COUNT; ++i) {
            if (types.get(static_cast<TerrainKind>(i)).symbol.empty()) {
                return invalid(fmt::format("terrain type '{}' has no symbol",
                                           terrain_kind_to_string(static_cast<TerrainKind>(i))));
            }
        }

        TreeConfig trees = get_tree_config();
        if (trees.min_patch_radius <= 0 || trees.max_patch_radius < trees.min_patch_radius) {
            return invalid("tree patch radius range is empty");
        }

        PerformanceConfig performance = get_performance_config();
        if (performance.deer_update_interval_ms == 0 || performance.companion_update_interval_ms == 0) {
            return invalid("tick intervals must be positive");
        }
        if (performance.statistics_sample_step <= 0) {
            return invalid("statistics sample step must be positive");
        }
        if (performance.max_cached_samples == 0) {
            return invalid("max_cached_samples must be positive");
        }
    } catch (const ConfigurationError& e) {
        return invalid(e.what());
    } catch (const json::exception& e) {
        return invalid(fmt::format("malformed configuration value: {}", e.what()));
    }

    return core::Status::ok();
}

}  // namespace tileworld::world
