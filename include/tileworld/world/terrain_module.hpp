// TileWorld World System
// terrain_module.hpp - Terrain module interface and generation context

#pragma once

#include "types.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tileworld::world {

class TerrainModule;

// Thrown from generate() when module configuration contradicts itself or the bounds
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Per-position output of a module
struct ModuleSample {
    std::optional<TerrainKind> terrain;   // Set only by modules that decide the tile kind
    std::vector<std::string> features;    // Descriptive tags, e.g. "rock-hard"
    std::map<std::string, float> values;  // Module-specific payload

    [[nodiscard]] float value_or(const std::string& key, float fallback) const {
        auto it = values.find(key);
        return it != values.end() ? it->second : fallback;
    }
};

// ============================================================================
// World Context
// ============================================================================

// Explicit context threaded through module generation and queries
class WorldContext {
public:
    WorldContext() = default;
    WorldContext(const WorldBounds& bounds, int64_t seed) : bounds_(bounds), seed_(seed) {}

    [[nodiscard]] const WorldBounds& get_bounds() const { return bounds_; }
    [[nodiscard]] int64_t get_seed() const { return seed_; }
    [[nodiscard]] bool is_in_bounds(int32_t x, int32_t y) const { return bounds_.contains(x, y); }

    // Make a generated module visible to the modules after it
    void bind_module(std::string_view name, const TerrainModule* module);
    void unbind_module(std::string_view name);

    [[nodiscard]] const TerrainModule* find_module(std::string_view name) const;

    template <typename T>
    [[nodiscard]] const T* find_module_as(std::string_view name) const {
        return dynamic_cast<const T*>(find_module(name));
    }

private:
    WorldBounds bounds_{};
    int64_t seed_ = 0;
    std::unordered_map<std::string, const TerrainModule*> modules_;
};

// ============================================================================
// Terrain Module Interface
// ============================================================================

class TerrainModule {
public:
    virtual ~TerrainModule() = default;

    [[nodiscard]] virtual std::string_view get_name() const = 0;

    // Higher priority runs first among modules with no ordering constraint
    [[nodiscard]] virtual int get_priority() const = 0;

    // Modules whose generate() must complete before this one's
    [[nodiscard]] virtual std::vector<std::string> get_dependencies() const = 0;

    /// Build internal fields. Throws ConfigurationError for contradictory
    /// settings and std::exception subclasses for anything else.
    virtual void generate(const WorldContext& context) = 0;

    [[nodiscard]] virtual ModuleSample get_data_at(int32_t x, int32_t y, const WorldContext& context) const = 0;

    // Cheap predicate: can this module contribute at (x, y)?
    [[nodiscard]] virtual bool affects_position(int32_t x, int32_t y, const WorldContext& context) const {
        return context.is_in_bounds(x, y);
    }

    [[nodiscard]] virtual bool is_generated() const = 0;
};

}  // namespace tileworld::world
