// TileWorld Entity System
// movable_entity.cpp - Rule-checked movement

#include <spdlog/fmt/fmt.h>

#include <tileworld/core/logger.hpp>
#include <tileworld/entity/movable_entity.hpp>
#include <tileworld/world/world.hpp>

namespace tileworld::entity {

MovableEntity::MovableEntity(world::World& world, const world::Position& position, MovementRules rules)
    : world_(world), position_(position), rules_(std::move(rules)) {}

bool MovableEntity::can_move_to(int32_t x, int32_t y) const {
    return !get_block_reason(x, y).has_value();
}

std::optional<std::string> MovableEntity::get_block_reason(int32_t x, int32_t y) const {
    if (!world_.is_in_bounds(x, y)) {
        return std::string("Cannot move outside world boundaries");
    }

    auto feature = world_.get_feature_at(x, y);
    if (feature && feature->type == world::FeatureType::TreeTrunk) {
        return std::string("Cannot walk through a tree trunk");
    }

    world::TerrainKind kind = world_.get_terrain_at(x, y).terrain;
    std::string refused = fmt::format("Cannot walk on {}", world_.get_terrain_types().get(kind).display_name);

    if (rules_.forbids(kind)) {
        return refused;
    }

    // Rules narrow the world's walkability but never widen it
    if (rules_.allows(kind)) {
        if (!world_.can_move_to(x, y)) {
            return refused;
        }
        return std::nullopt;
    }

    if (const std::string* tag = rules_.required_access(kind)) {
        if (has_access(*tag) && world_.can_move_to(x, y)) {
            return std::nullopt;
        }
    }
    return refused;
}

bool MovableEntity::move(int32_t dx, int32_t dy) {
    world::Position target{position_.x + dx, position_.y + dy};
    auto reason = get_block_reason(target.x, target.y);
    if (reason) {
        last_block_reason_ = *reason;
        TILEWORLD_LOG_DEBUG(core::log_category::ENTITY, "Move to ({}, {}) blocked: {}", target.x, target.y, *reason);
        if (blocked_handler_) {
            blocked_handler_(*this, target, *reason);
        }
        return false;
    }

    position_ = target;
    last_block_reason_.clear();
    return true;
}

Player::Player(world::World& world, const world::Position& position)
    : MovableEntity(world, position, MovementRules::player()) {}

}  // namespace tileworld::entity
