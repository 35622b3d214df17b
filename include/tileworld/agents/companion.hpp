// TileWorld Agents
// companion.hpp - Dog that follows the player

#pragma once

#include <tileworld/entity/movable_entity.hpp>
#include <tileworld/world/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace tileworld::agents {

enum class CompanionState : uint8_t {
    Idle = 0,
    Following,
    Coming,
    Count
};

[[nodiscard]] const char* companion_state_to_string(CompanionState state);
[[nodiscard]] std::optional<CompanionState> companion_state_from_string(std::string_view name);

struct CompanionConfig {
    int follow_distance = 2;       // Chebyshev
    int idle_timeout_ticks = 20;   // Player stationary this long sends the companion idle
    world::Position spawn_position{17, 17};
    int spawn_search_radius = 2;
    world::Position default_player{15, 15};
    uint64_t update_interval_ms = 200;
};

class Companion : public entity::MovableEntity {
public:
    Companion(world::World& world, const world::Position& position, const CompanionConfig& config);

    [[nodiscard]] CompanionState get_state() const { return state_; }
    [[nodiscard]] uint64_t get_last_decision_tick() const { return last_decision_tick_; }
    [[nodiscard]] int get_stationary_ticks() const { return stationary_ticks_; }

    // Head for the player regardless of follow distance
    void come();

    void update(const world::Position& player, uint64_t tick);

    // One greedy step: diagonal, then the dominant axis, then the other axis
    bool step_toward(const world::Position& target);

    void set_config(const CompanionConfig& config) { config_ = config; }

private:
    void enter(CompanionState state);

    CompanionConfig config_;
    CompanionState state_ = CompanionState::Following;
    uint64_t last_decision_tick_ = 0;
    std::optional<world::Position> last_player_;
    int stationary_ticks_ = 0;
};

}  // namespace tileworld::agents
