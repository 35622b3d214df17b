// TileWorld Test Support
// painted_terrain.hpp - Terrain module with hand-painted kinds for deterministic worlds

#pragma once

#include <tileworld/core/config.hpp>
#include <tileworld/world/module_registry.hpp>
#include <tileworld/world/terrain_module.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>

namespace tileworld::test {

using PaintFn = std::function<std::optional<world::TerrainKind>(int32_t x, int32_t y)>;

class PaintedTerrainModule final : public world::TerrainModule {
public:
    static constexpr const char* NAME = "painted";

    explicit PaintedTerrainModule(PaintFn paint) : paint_(std::move(paint)) {}

    [[nodiscard]] std::string_view get_name() const override { return NAME; }
    [[nodiscard]] int get_priority() const override { return 50; }
    [[nodiscard]] std::vector<std::string> get_dependencies() const override { return {}; }

    void generate(const world::WorldContext&) override { generated_ = true; }

    [[nodiscard]] world::ModuleSample get_data_at(int32_t x, int32_t y, const world::WorldContext&) const override {
        world::ModuleSample sample;
        sample.terrain = paint_ ? paint_(x, y) : std::nullopt;
        return sample;
    }

    [[nodiscard]] bool is_generated() const override { return generated_; }

private:
    PaintFn paint_;
    bool generated_ = false;
};

// Default modules plus "painted"
inline world::ModuleRegistry painted_registry(PaintFn paint) {
    auto registry = world::ModuleRegistry::with_defaults();
    registry.register_module_type(PaintedTerrainModule::NAME, [paint](const world::TerrainSettings&) {
        return std::make_unique<PaintedTerrainModule>(paint);
    });
    return registry;
}

// Painted plains everywhere, the given kind wherever `paint` says so
inline PaintFn plains_except(std::function<std::optional<world::TerrainKind>(int32_t, int32_t)> paint) {
    return [paint](int32_t x, int32_t y) -> std::optional<world::TerrainKind> {
        if (auto kind = paint(x, y)) {
            return kind;
        }
        return world::TerrainKind::Plains;
    };
}

// Bounds, the painted module only, and no trees
inline void use_painted_world(core::Config& config, const world::WorldBounds& bounds, int64_t seed = 7) {
    config.merge_section(core::config_section::WORLD, {{"min_x", bounds.min_x},
                                                       {"max_x", bounds.max_x},
                                                       {"min_y", bounds.min_y},
                                                       {"max_y", bounds.max_y},
                                                       {"seed", seed},
                                                       {"modules", nlohmann::json::array({PaintedTerrainModule::NAME})}});
    config.set_bool(core::config_section::TREES, "enabled", false);
}

}  // namespace tileworld::test
