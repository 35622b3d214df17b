// TileWorld Engine Core
// config.hpp - JSON-backed configuration store with section overlays

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tileworld::core {

// Configuration store. Holds one JSON object per section; typed views over
// the sections live with the subsystems that consume them.
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Load operations. Loaded documents are overlaid on the defaults section by section.
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view text);

    // Typed getters with defaults
    [[nodiscard]] int get_int(std::string_view section, std::string_view key,
                               int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                     double default_value = 0.0) const;
    [[nodiscard]] float get_float(std::string_view section, std::string_view key,
                                   float default_value = 0.0f) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key,
                                 bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                          std::string_view default_value = "") const;

    // Setters
    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);
    void set_value(std::string_view section, std::string_view key, const nlohmann::json& value);

    // Raw section access. Missing sections read as an empty object.
    [[nodiscard]] const nlohmann::json& section(std::string_view name) const;
    [[nodiscard]] const nlohmann::json& data() const;

    /// Shallow overlay: every top-level key of `values` replaces the key of
    /// the same name in `section`. Returns false if `values` is not an object.
    bool merge_section(std::string_view section, const nlohmann::json& values);

    // Check existence
    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;
    [[nodiscard]] std::vector<std::string> section_names() const;

    bool remove(std::string_view section, std::string_view key);

    // Change notification callback
    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    // Dirty tracking
    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    [[nodiscard]] std::string dump(int indent = 2) const;

    // Reset to the built-in defaults
    void set_defaults();

private:
    void notify(std::string_view section, std::string_view key);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Pre-defined section names for consistency
namespace config_section {
    inline constexpr const char* WORLD = "world";
    inline constexpr const char* TERRAIN_TYPES = "terrain_types";
    inline constexpr const char* GEOLOGY = "geology";
    inline constexpr const char* ELEVATION = "elevation";
    inline constexpr const char* HYDROLOGY = "hydrology";
    inline constexpr const char* CLASSIFIER = "classifier";
    inline constexpr const char* TREES = "trees";
    inline constexpr const char* DEER = "deer";
    inline constexpr const char* COMPANION = "companion";
    inline constexpr const char* PERFORMANCE = "performance";
    inline constexpr const char* PRESETS = "presets";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

// Pre-defined key names for consistency
namespace config_key {
    // World section
    inline constexpr const char* MIN_X = "min_x";
    inline constexpr const char* MAX_X = "max_x";
    inline constexpr const char* MIN_Y = "min_y";
    inline constexpr const char* MAX_Y = "max_y";
    inline constexpr const char* SEED = "seed";
    inline constexpr const char* MODULES = "modules";

    // Geology section
    inline constexpr const char* FORMATIONS = "formations";
    inline constexpr const char* ROCK_PROPERTIES = "rock_properties";

    // Performance section
    inline constexpr const char* DEER_UPDATE_INTERVAL_MS = "deer_update_interval_ms";
    inline constexpr const char* COMPANION_UPDATE_INTERVAL_MS = "companion_update_interval_ms";
    inline constexpr const char* STATISTICS_SAMPLE_STEP = "statistics_sample_step";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
}  // namespace config_key

}  // namespace tileworld::core
