// TileWorld Entity System
// movable_entity.hpp - Position plus rule-checked movement against the world

#pragma once

#include "movement_rules.hpp"

#include <tileworld/world/types.hpp>

#include <functional>
#include <optional>
#include <set>
#include <string>

namespace tileworld::world {
class World;
}

namespace tileworld::entity {

class MovableEntity;

// Called with the entity, the refused target and a human-readable reason
using BlockedHandler = std::function<void(const MovableEntity&, const world::Position&, const std::string&)>;

class MovableEntity {
public:
    MovableEntity(world::World& world, const world::Position& position, MovementRules rules = MovementRules::defaults());
    virtual ~MovableEntity() = default;

    MovableEntity(const MovableEntity&) = default;
    MovableEntity& operator=(const MovableEntity&) = delete;

    // ========================================================================
    // Movement
    // ========================================================================

    [[nodiscard]] bool can_move_to(int32_t x, int32_t y) const;

    // Reason the target is refused, nullopt if it can be entered
    [[nodiscard]] std::optional<std::string> get_block_reason(int32_t x, int32_t y) const;

    /// Attempt (x + dx, y + dy). On refusal the position is unchanged and the
    /// blocked handler receives the reason.
    bool move(int32_t dx, int32_t dy);

    // Unchecked placement
    void set_position(const world::Position& position) { position_ = position; }

    [[nodiscard]] const world::Position& get_position() const { return position_; }
    [[nodiscard]] int32_t get_x() const { return position_.x; }
    [[nodiscard]] int32_t get_y() const { return position_.y; }

    // ========================================================================
    // Rules and access
    // ========================================================================

    [[nodiscard]] const MovementRules& get_rules() const { return rules_; }
    void set_rules(MovementRules rules) { rules_ = std::move(rules); }

    void grant_access(const std::string& tag) { access_.insert(tag); }
    void revoke_access(const std::string& tag) { access_.erase(tag); }
    [[nodiscard]] bool has_access(const std::string& tag) const { return access_.count(tag) > 0; }

    void set_blocked_handler(BlockedHandler handler) { blocked_handler_ = std::move(handler); }

    [[nodiscard]] const std::string& get_last_block_reason() const { return last_block_reason_; }

protected:
    [[nodiscard]] world::World& get_world() const { return world_; }

private:
    world::World& world_;
    world::Position position_;
    MovementRules rules_;
    std::set<std::string> access_;
    BlockedHandler blocked_handler_;
    std::string last_block_reason_;
};

// The player: rule set widened to mountains
class Player : public MovableEntity {
public:
    static constexpr world::Position DEFAULT_POSITION{15, 15};

    explicit Player(world::World& world, const world::Position& position = DEFAULT_POSITION);
};

}  // namespace tileworld::entity
