// TileWorld Agents
// deer.hpp - Wandering, alert and fleeing wildlife

#pragma once

#include <tileworld/entity/movable_entity.hpp>
#include <tileworld/world/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace tileworld::agents {

enum class DeerState : uint8_t {
    Wandering = 0,
    Alert,
    Fleeing,
    Count
};

[[nodiscard]] const char* deer_state_to_string(DeerState state);
[[nodiscard]] std::optional<DeerState> deer_state_from_string(std::string_view name);

struct DeerConfig {
    // Herd
    int deer_count = 20;
    int spawn_attempts = 200;
    int spawn_margin = 10;
    float min_spacing = 5.0f;

    // Perception (Euclidean)
    int vision_range = 8;
    int alert_range = 5;
    int panic_distance = 2;

    // Behaviour, in ticks
    int alert_confirm_ticks = 2;  // Consecutive close ticks before fleeing
    int lose_sight_ticks = 3;     // Unseen ticks before alert relaxes
    int flee_calm_ticks = 6;      // Unseen ticks before fleeing stops
    float wander_move_chance = 0.3f;
    float herd_alert_radius = 12.0f;

    world::Position default_player{0, 0};
    uint64_t update_interval_ms = 750;
    bool debug = false;
};

class Deer : public entity::MovableEntity {
public:
    Deer(world::World& world, uint32_t id, const world::Position& position, const DeerConfig& config, int64_t seed);

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] DeerState get_state() const { return state_; }
    [[nodiscard]] int32_t get_vision_range() const { return config_.vision_range; }
    [[nodiscard]] uint64_t get_last_decision_tick() const { return last_decision_tick_; }
    [[nodiscard]] const std::optional<world::Position>& get_target() const { return target_; }

    // Unit direction (-1..1 per axis) the deer last turned to
    [[nodiscard]] const world::Position& get_facing() const { return facing_; }

    /// Within vision range and no opaque cell strictly between the deer and
    /// the target. Canopy, trunks and boundary cells are opaque.
    [[nodiscard]] bool can_see_position(int32_t x, int32_t y) const;

    [[nodiscard]] std::vector<world::Position> get_visible_tiles() const;

    // One FSM step. `peers` may include this deer.
    void update(const world::Position& player, const std::vector<const Deer*>& peers, uint64_t tick);

    // Forced transitions; reset the behaviour counters
    void scare(const world::Position& threat);
    void calm();

    // Takes effect from the next update; state and counters are kept
    void set_config(const DeerConfig& config) { config_ = config; }

private:
    void enter(DeerState state);
    void face(const world::Position& target);
    [[nodiscard]] double roll(uint64_t tick, uint32_t channel) const;

    void wander(uint64_t tick);
    void flee(const world::Position& threat, const std::vector<const Deer*>& peers);

    uint32_t id_;
    DeerConfig config_;
    int64_t seed_;

    DeerState state_ = DeerState::Wandering;
    uint64_t last_decision_tick_ = 0;
    std::optional<world::Position> target_;
    world::Position facing_{0, 1};
    int close_ticks_ = 0;
    int unseen_ticks_ = 0;
};

}  // namespace tileworld::agents
