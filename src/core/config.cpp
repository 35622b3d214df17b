// TileWorld Engine Core
// config.cpp - JSON-backed configuration store implementation

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <tileworld/core/config.hpp>
#include <tileworld/core/logger.hpp>

namespace tileworld::core {

using json = nlohmann::json;

namespace {

// Built-in defaults. Every section a subsystem reads is present here so
// that a partial user document only has to name what it changes.
constexpr const char* DEFAULT_CONFIG = R"json(
{
    "world": {
        "min_x": -100, "max_x": 100, "min_y": -100, "max_y": 100,
        "seed": 12345,
        "modules": ["geology", "elevation", "hydrology"]
    },
    "terrain_types": {
        "plains":    { "symbol": "▓", "style_tag": "terrain-grass",    "name": "Plains",    "walkable": true },
        "forest":    { "symbol": "♣", "style_tag": "terrain-forest",   "name": "Forest",    "walkable": true },
        "foothills": { "symbol": "▒", "style_tag": "terrain-hills",    "name": "Foothills", "walkable": true },
        "mountain":  { "symbol": "▲", "style_tag": "terrain-mountain", "name": "Mountain",  "walkable": true },
        "road":      { "symbol": "═", "style_tag": "terrain-road",     "name": "Road",      "walkable": true },
        "trail":     { "symbol": "·", "style_tag": "terrain-trail",    "name": "Trail",     "walkable": true },
        "river":     { "symbol": "~", "style_tag": "terrain-water",    "name": "River",     "walkable": false },
        "lake":      { "symbol": "▀", "style_tag": "terrain-water",    "name": "Lake",      "walkable": false },
        "building":  { "symbol": "■", "style_tag": "terrain-building", "name": "Building",  "walkable": true },
        "village":   { "symbol": "⌂", "style_tag": "terrain-village",  "name": "Village",   "walkable": true },
        "unknown":   { "symbol": "░", "style_tag": "terrain-unknown",  "name": "Unknown",   "walkable": false }
    },
    "geology": {
        "formations": [
            { "type": "granite_intrusion", "count": 2, "min_radius": 40, "max_radius": 80,
              "rock_type": "hard", "elevation_effect": 0.6 },
            { "type": "limestone_beds", "count": 3, "min_radius": 30, "max_radius": 60,
              "rock_type": "soft", "elevation_effect": -0.3 },
            { "type": "clay_deposits", "count": 4, "min_radius": 20, "max_radius": 40,
              "rock_type": "clay", "elevation_effect": -0.1 }
        ],
        "rock_properties": {
            "hard": { "erosion_resistance": 0.9, "soil_quality": 0.2, "water_retention": 0.1, "elevation_bonus": 0.4 },
            "soft": { "erosion_resistance": 0.3, "soil_quality": 0.8, "water_retention": 0.4, "elevation_bonus": -0.2 },
            "clay": { "erosion_resistance": 0.5, "soil_quality": 0.6, "water_retention": 0.9, "elevation_bonus": -0.1 }
        },
        "base_rock_type": "soft",
        "center_margin": 30,
        "weathering_effect": 0.3,
        "perturbation_noise_threshold": 0.7,
        "perturbation_sample_threshold": 0.8
    },
    "elevation": {
        "use_geology": true,
        "geological_strength": 0.7,
        "base_elevation": 0.2,
        "max_elevation": 1.0,
        "erosion_strength": 0.3,
        "noise_amount": 0.05,
        "noise_frequency": 0.02,
        "noise_octaves": 3,
        "smoothing_passes": 2,
        "hill_count": 6,
        "min_hill_radius": 20,
        "max_hill_radius": 35,
        "min_hill_height": 0.25,
        "max_hill_height": 0.45
    },
    "hydrology": {
        "spring_count": 8,
        "spring_elevation_min": 0.25,
        "spring_spacing": 12,
        "spring_candidates": 400,
        "max_river_length": 100,
        "min_river_length": 10,
        "hard_rock_avoidance": 0.4,
        "soft_rock_preference": 0.6,
        "clay_channeling": 0.4,
        "lake_count": 4,
        "min_lake_radius": 6,
        "max_lake_radius": 18,
        "lake_spacing": 35,
        "lake_sample_step": 12,
        "lake_low_elevation_max": 0.3,
        "lake_retention_min": 0.35,
        "lake_clay_preference": 0.6,
        "lake_hard_rock_avoidance": 0.4,
        "confluence_enabled": true,
        "confluence_distance": 8
    },
    "classifier": {
        "forest_threshold": 0.28,
        "foothills_threshold": 0.45,
        "mountain_threshold": 0.75,
        "hysteresis": 0.02
    },
    "trees": {
        "enabled": true,
        "forest_patch_count": 3,
        "min_patch_radius": 15,
        "max_patch_radius": 24,
        "scattered_tree_count": 15,
        "max_trees": 50,
        "patch_density": 0.08,
        "min_tree_spacing": 2,
        "boundary_margin": 2
    },
    "deer": {
        "deer_count": 20,
        "spawn_attempts": 200,
        "spawn_margin": 10,
        "min_spacing": 5.0,
        "vision_range": 8,
        "alert_range": 5,
        "panic_distance": 2,
        "alert_confirm_ticks": 2,
        "lose_sight_ticks": 3,
        "flee_calm_ticks": 6,
        "wander_move_chance": 0.3,
        "herd_alert_radius": 12,
        "default_player_x": 0,
        "default_player_y": 0
    },
    "companion": {
        "follow_distance": 2,
        "idle_timeout_ticks": 20,
        "spawn_x": 17,
        "spawn_y": 17,
        "spawn_search_radius": 2,
        "default_player_x": 15,
        "default_player_y": 15
    },
    "performance": {
        "deer_update_interval_ms": 750,
        "companion_update_interval_ms": 200,
        "statistics_sample_step": 8,
        "exploration_radius": 8,
        "max_catch_up_ticks": 16,
        "max_cached_samples": 65536
    },
    "presets": {
        "elevation": {
            "flat":    { "geological_strength": 0.4, "noise_amount": 0.03, "hill_count": 2,
                         "min_hill_radius": 15, "max_hill_radius": 25, "min_hill_height": 0.18, "max_hill_height": 0.28 },
            "rolling": { "geological_strength": 0.7, "noise_amount": 0.05, "hill_count": 6,
                         "min_hill_radius": 20, "max_hill_radius": 35, "min_hill_height": 0.25, "max_hill_height": 0.45 },
            "hilly":   { "geological_strength": 0.9, "noise_amount": 0.08, "hill_count": 10,
                         "min_hill_radius": 18, "max_hill_radius": 32, "min_hill_height": 0.3, "max_hill_height": 0.55 }
        },
        "water": {
            "dry":    { "spring_count": 2, "lake_count": 2 },
            "normal": { "spring_count": 8, "lake_count": 4 },
            "wet":    { "spring_count": 12, "lake_count": 6 }
        },
        "geological": {
            "mountainous": { "formations": [
                { "type": "granite_range", "count": 2, "min_radius": 60, "max_radius": 100, "rock_type": "hard", "elevation_effect": 0.9 },
                { "type": "valley_systems", "count": 3, "min_radius": 30, "max_radius": 50, "rock_type": "soft", "elevation_effect": -0.4 }
            ]},
            "rolling": { "formations": [
                { "type": "soft_hills", "count": 4, "min_radius": 30, "max_radius": 50, "rock_type": "soft", "elevation_effect": 0.3 },
                { "type": "clay_valleys", "count": 3, "min_radius": 25, "max_radius": 40, "rock_type": "clay", "elevation_effect": -0.2 }
            ]},
            "flat": { "formations": [
                { "type": "sedimentary_layers", "count": 5, "min_radius": 40, "max_radius": 80, "rock_type": "soft", "elevation_effect": 0.1 },
                { "type": "clay_basins", "count": 4, "min_radius": 30, "max_radius": 60, "rock_type": "clay", "elevation_effect": -0.05 }
            ]},
            "volcanic": { "formations": [
                { "type": "volcanic_peaks", "count": 2, "min_radius": 20, "max_radius": 35, "rock_type": "hard", "elevation_effect": 1.0 },
                { "type": "lava_plains", "count": 3, "min_radius": 50, "max_radius": 80, "rock_type": "hard", "elevation_effect": 0.2 },
                { "type": "ash_valleys", "count": 2, "min_radius": 30, "max_radius": 50, "rock_type": "soft", "elevation_effect": -0.1 }
            ]},
            "granite_heavy": { "formations": [
                { "type": "granite_batholith", "count": 6, "min_radius": 45, "max_radius": 90, "rock_type": "hard", "elevation_effect": 1.0 }
            ]}
        }
    },
    "debug": {
        "log_level": "info",
        "deer_debug": false
    }
}
)json";

const json& empty_object() {
    static const json empty = json::object();
    return empty;
}

}  // namespace

struct Config::Impl {
    json data;
    ChangeCallback change_callback;
    bool dirty = false;
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        TILEWORLD_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_string(buffer.str())) {
        return false;
    }

    TILEWORLD_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view text) {
    json loaded;
    try {
        loaded = json::parse(text);
    } catch (const json::parse_error& e) {
        TILEWORLD_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }

    if (!loaded.is_object()) {
        TILEWORLD_LOG_ERROR(log_category::CONFIG, "Config document must be a JSON object");
        return false;
    }

    for (const auto& [name, values] : loaded.items()) {
        if (values.is_object() && impl_->data.contains(name) && impl_->data[name].is_object()) {
            merge_section(name, values);
        } else {
            impl_->data[name] = values;
            impl_->dirty = true;
        }
    }
    return true;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    try {
        if (has(section, key)) {
            return impl_->data[std::string(section)][std::string(key)].get<int>();
        }
    } catch (const json::exception&) {
        // Type mismatch, return default
    }
    return default_value;
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    try {
        if (has(section, key)) {
            return impl_->data[std::string(section)][std::string(key)].get<double>();
        }
    } catch (const json::exception&) {
        // Type mismatch, return default
    }
    return default_value;
}

float Config::get_float(std::string_view section, std::string_view key, float default_value) const {
    return static_cast<float>(get_double(section, key, static_cast<double>(default_value)));
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    try {
        if (has(section, key)) {
            return impl_->data[std::string(section)][std::string(key)].get<bool>();
        }
    } catch (const json::exception&) {
        // Type mismatch, return default
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key,
                               std::string_view default_value) const {
    try {
        if (has(section, key)) {
            return impl_->data[std::string(section)][std::string(key)].get<std::string>();
        }
    } catch (const json::exception&) {
        // Type mismatch, return default
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify(section, key);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify(section, key);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify(section, key);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->data[std::string(section)][std::string(key)] = std::string(value);
    notify(section, key);
}

void Config::set_value(std::string_view section, std::string_view key, const json& value) {
    impl_->data[std::string(section)][std::string(key)] = value;
    notify(section, key);
}

const json& Config::section(std::string_view name) const {
    auto it = impl_->data.find(std::string(name));
    if (it == impl_->data.end() || !it->is_object()) {
        return empty_object();
    }
    return *it;
}

const json& Config::data() const {
    return impl_->data;
}

bool Config::merge_section(std::string_view section, const json& values) {
    if (!values.is_object()) {
        TILEWORLD_LOG_WARN(log_category::CONFIG, "Ignoring non-object overlay for section '{}'", section);
        return false;
    }

    auto& target = impl_->data[std::string(section)];
    if (!target.is_object()) {
        target = json::object();
    }
    for (const auto& [key, value] : values.items()) {
        target[key] = value;
        notify(section, key);
    }
    impl_->dirty = true;
    return true;
}

bool Config::has(std::string_view section, std::string_view key) const {
    const auto& s = this->section(section);
    return s.contains(std::string(key));
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

std::vector<std::string> Config::section_names() const {
    std::vector<std::string> names;
    for (const auto& [name, value] : impl_->data.items()) {
        names.push_back(name);
    }
    return names;
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

std::string Config::dump(int indent) const {
    return impl_->data.dump(indent);
}

void Config::set_defaults() {
    impl_->data = json::parse(DEFAULT_CONFIG);
    impl_->dirty = true;
}

void Config::notify(std::string_view section, std::string_view key) {
    impl_->dirty = true;
    if (impl_->change_callback) {
        impl_->change_callback(section, key);
    }
}

}  // namespace tileworld::core
