// TileWorld Agents
// companion_manager.hpp - Companion spawning, ticking and rendering

#pragma once

#include "agent_types.hpp"
#include "companion.hpp"

#include <tileworld/core/config.hpp>
#include <tileworld/core/status.hpp>
#include <tileworld/core/tick_scheduler.hpp>
#include <tileworld/world/world.hpp>

#include <optional>

namespace tileworld::agents {

[[nodiscard]] CompanionConfig load_companion_config(const core::Config& config);
[[nodiscard]] core::Status validate_companion_config(const CompanionConfig& config);

class CompanionManager {
public:
    CompanionManager(world::World& world, const CompanionConfig& config = {});
    ~CompanionManager();

    CompanionManager(const CompanionManager&) = delete;
    CompanionManager& operator=(const CompanionManager&) = delete;

    // Place at the configured spawn point, or the nearest tile the companion may
    // stand on within the search radius
    bool spawn();
    bool spawn_near(const world::Position& position);
    void despawn();

    [[nodiscard]] bool has_companion() const { return companion_.has_value(); }
    [[nodiscard]] const Companion* get_companion() const { return companion_ ? &*companion_ : nullptr; }

    // "Come" command
    bool call_companion();

    void set_player_locator(PlayerLocator locator);
    void update(uint64_t tick);

    bool attach(core::TickScheduler& scheduler);
    void detach();
    [[nodiscard]] bool is_attached() const { return ticker_ != core::INVALID_TICKER; }

    // Companion overlay on `base`, unless canopy hides it
    [[nodiscard]] world::RenderedCell render(const world::Position& position, const world::RenderedCell& base) const;

    [[nodiscard]] const CompanionConfig& get_config() const { return config_; }

    // A changed tick interval re-registers the ticker
    void set_config(const CompanionConfig& config);

private:
    [[nodiscard]] world::Position current_player_position() const;

    world::World& world_;
    CompanionConfig config_;
    std::optional<Companion> companion_;

    PlayerLocator player_locator_;
    core::TickScheduler* scheduler_ = nullptr;
    core::TickerId ticker_ = core::INVALID_TICKER;
};

}  // namespace tileworld::agents
