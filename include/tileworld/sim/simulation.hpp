// TileWorld Simulation
// simulation.hpp - Wires world, player and agent managers behind the command surface

#pragma once

#include <tileworld/agents/companion_manager.hpp>
#include <tileworld/agents/deer_manager.hpp>
#include <tileworld/core/clock.hpp>
#include <tileworld/core/config.hpp>
#include <tileworld/core/status.hpp>
#include <tileworld/core/tick_scheduler.hpp>
#include <tileworld/entity/movable_entity.hpp>
#include <tileworld/world/world.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tileworld::sim {

// Owns every runtime subsystem. Agent tickers run only from update(), on the
// caller's thread, against the caller's clock.
class Simulation {
public:
    Simulation(core::Config& config, const core::MonotonicClock& clock,
               world::ModuleRegistry registry = world::ModuleRegistry::with_defaults());
    ~Simulation();

    // Non-copyable, non-movable
    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    // Generate the world, place the player, spawn agents and register tickers
    [[nodiscard]] core::Status initialize();
    void shutdown();
    [[nodiscard]] bool is_initialized() const;

    // ========================================================================
    // Commands
    // ========================================================================

    // Moves and reveals the surroundings; a refusal is kept as the last message
    bool move_player(int32_t dx, int32_t dy);
    bool call_companion();
    bool toggle_deer_debug();

    [[nodiscard]] core::Status regenerate_world();
    [[nodiscard]] core::Status regenerate_module(std::string_view name);
    [[nodiscard]] core::Status apply_geological_preset(std::string_view name);
    [[nodiscard]] core::Status quick_config_elevation(std::string_view method);
    [[nodiscard]] core::Status quick_config_water(std::string_view level);

    /// Overlay `values` on `section`. Terrain type, classifier and tree updates
    /// move agents off tiles they may no longer stand on; deer, companion,
    /// debug and performance updates reach the running agents and tickers.
    /// A rejected update leaves the configuration as it was.
    [[nodiscard]] core::Status update_configuration(std::string_view section, const nlohmann::json& values);

    // Run every tick due at the clock's current time; returns ticks executed
    size_t update();

    // ========================================================================
    // Views
    // ========================================================================

    // Terrain with deer and companion overlays
    [[nodiscard]] world::RenderedCell render_cell(int32_t x, int32_t y) const;

    // Row-major cells of `area`, top row first
    [[nodiscard]] std::vector<std::vector<world::RenderedCell>> render_view(const world::WorldBounds& area) const;

    [[nodiscard]] nlohmann::json export_world_state() const;

    [[nodiscard]] const std::string& get_last_message() const;

    // ========================================================================
    // Subsystem access
    // ========================================================================

    [[nodiscard]] world::World& get_world();
    [[nodiscard]] const world::World& get_world() const;
    [[nodiscard]] entity::Player* get_player();
    [[nodiscard]] const entity::Player* get_player() const;
    [[nodiscard]] agents::DeerManager& get_deer_manager();
    [[nodiscard]] const agents::DeerManager& get_deer_manager() const;
    [[nodiscard]] agents::CompanionManager& get_companion_manager();
    [[nodiscard]] const agents::CompanionManager& get_companion_manager() const;
    [[nodiscard]] core::TickScheduler& get_scheduler();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Nearest passable tile to `origin` within a Chebyshev radius
[[nodiscard]] std::optional<world::Position> find_nearest_passable(const world::World& world,
                                                                   const world::Position& origin, int32_t max_radius);

// Nearest tile `entity` may stand on under its own rules
[[nodiscard]] std::optional<world::Position> find_nearest_footing(const entity::MovableEntity& entity,
                                                                  const world::Position& origin, int32_t max_radius);

}  // namespace tileworld::sim
