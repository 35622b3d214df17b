// TileWorld Agents
// deer_manager.hpp - Herd spawning, ticking and rendering

#pragma once

#include "agent_types.hpp"
#include "deer.hpp"

#include <tileworld/core/config.hpp>
#include <tileworld/core/status.hpp>
#include <tileworld/core/tick_scheduler.hpp>
#include <tileworld/world/world.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

namespace tileworld::agents {

// Parse the deer section plus its tick interval and debug flag
[[nodiscard]] DeerConfig load_deer_config(const core::Config& config);

// Ranges and tick counts the state machine can run with
[[nodiscard]] core::Status validate_deer_config(const DeerConfig& config);

// Outcome of a spawn pass. A shortfall is informational.
struct SpawnReport {
    size_t requested = 0;
    size_t placed = 0;
    size_t attempts = 0;

    [[nodiscard]] bool is_shortfall() const { return placed < requested; }
};

struct DeerDebugInfo {
    uint32_t id = 0;
    world::Position position{0, 0};
    DeerState state = DeerState::Wandering;
    int32_t vision_range = 0;
    uint64_t last_decision_tick = 0;
    std::optional<world::Position> target;
};

struct DeerStateCounts {
    size_t wandering = 0;
    size_t alert = 0;
    size_t fleeing = 0;
};

// ============================================================================
// Deer Manager
// ============================================================================

class DeerManager {
public:
    DeerManager(world::World& world, const DeerConfig& config = {});
    ~DeerManager();

    DeerManager(const DeerManager&) = delete;
    DeerManager& operator=(const DeerManager&) = delete;

    // ========================================================================
    // Spawning
    // ========================================================================

    // Seeded placement on passable dry land, spaced apart, inside the margin
    SpawnReport spawn_deer();

    // Replaces the herd in one step
    SpawnReport respawn_deer();

    // Adds a deer at an exact position; false if the tile is not passable dry land
    bool place_deer(const world::Position& position);

    void clear();

    // ========================================================================
    // Ticking
    // ========================================================================

    void set_player_locator(PlayerLocator locator);

    // All deer see the same player snapshot; one failing deer does not stop the rest
    void update(uint64_t tick);

    // Register a ticker at the configured interval
    bool attach(core::TickScheduler& scheduler);
    void detach();
    [[nodiscard]] bool is_attached() const { return ticker_ != core::INVALID_TICKER; }

    // ========================================================================
    // Rendering and queries
    // ========================================================================

    // Deer overlay on `base`, unless canopy hides it
    [[nodiscard]] world::RenderedCell render(const world::Position& position, const world::RenderedCell& base) const;

    [[nodiscard]] const Deer* get_deer_at(const world::Position& position) const;
    [[nodiscard]] std::vector<const Deer*> get_deer_near(const world::Position& position, double radius) const;
    [[nodiscard]] const std::vector<Deer>& get_deer() const { return deer_; }
    [[nodiscard]] size_t get_deer_count() const { return deer_.size(); }

    [[nodiscard]] const SpawnReport& get_last_spawn_report() const { return last_spawn_; }
    [[nodiscard]] DeerStateCounts get_state_counts() const;

    void scare_all(const world::Position& threat);
    void calm_all();

    // ========================================================================
    // Debug
    // ========================================================================

    bool toggle_debug_mode();
    [[nodiscard]] bool is_debug_mode() const { return config_.debug; }
    [[nodiscard]] std::vector<DeerDebugInfo> get_debug_info() const;

    // Union of every deer's visible tiles
    [[nodiscard]] std::unordered_set<world::Position> get_visible_tiles() const;

    [[nodiscard]] const DeerConfig& get_config() const { return config_; }

    /// Replace the settings of the manager and every deer. A changed tick
    /// interval re-registers the ticker; deer_count applies at the next spawn.
    void set_config(const DeerConfig& config);

private:
    [[nodiscard]] bool is_spawnable(const world::Position& position) const;
    [[nodiscard]] world::Position current_player_position() const;

    world::World& world_;
    DeerConfig config_;
    std::vector<Deer> deer_;
    uint32_t next_id_ = 1;
    uint32_t spawn_generation_ = 0;
    SpawnReport last_spawn_;

    PlayerLocator player_locator_;
    core::TickScheduler* scheduler_ = nullptr;
    core::TickerId ticker_ = core::INVALID_TICKER;
};

}  // namespace tileworld::agents
