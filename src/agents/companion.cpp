// TileWorld Agents
// companion.cpp - Companion state machine

#include <cstdlib>
#include <tileworld/agents/companion.hpp>
#include <tileworld/core/logger.hpp>

namespace tileworld::agents {

using world::Position;

namespace {

int32_t sign(int32_t value) {
    return (value > 0) - (value < 0);
}

}  // namespace

const char* companion_state_to_string(CompanionState state) {
    switch (state) {
        case CompanionState::Idle:
            return "idle";
        case CompanionState::Following:
            return "following";
        case CompanionState::Coming:
            return "coming";
        default:
            return "unknown";
    }
}

std::optional<CompanionState> companion_state_from_string(std::string_view name) {
    for (uint8_t i = 0; i < static_cast<uint8_t>(CompanionState::Count); ++i) {
        auto state = static_cast<CompanionState>(i);
        if (name == companion_state_to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

Companion::Companion(world::World& world, const Position& position, const CompanionConfig& config)
    : MovableEntity(world, position), config_(config) {}

void Companion::come() {
    enter(CompanionState::Coming);
}

void Companion::update(const Position& player, uint64_t tick) {
    last_decision_tick_ = tick;

    const bool player_moved = last_player_ && *last_player_ != player;
    last_player_ = player;
    stationary_ticks_ = player_moved ? 0 : stationary_ticks_ + 1;

    switch (state_) {
        case CompanionState::Idle:
            if (stationary_ticks_ >= config_.idle_timeout_ticks) {
                return;
            }
            enter(CompanionState::Following);
            [[fallthrough]];

        case CompanionState::Following:
            if (stationary_ticks_ >= config_.idle_timeout_ticks) {
                enter(CompanionState::Idle);
                return;
            }
            if (world::chebyshev_distance(get_position(), player) > config_.follow_distance) {
                step_toward(player);
            }
            return;

        case CompanionState::Coming:
            if (world::chebyshev_distance(get_position(), player) > config_.follow_distance) {
                step_toward(player);
            }
            if (world::chebyshev_distance(get_position(), player) <= config_.follow_distance) {
                enter(CompanionState::Following);
                stationary_ticks_ = 0;
            }
            return;

        default:
            return;
    }
}

bool Companion::step_toward(const Position& target) {
    const int32_t dx = target.x - get_x();
    const int32_t dy = target.y - get_y();
    const int32_t sx = sign(dx);
    const int32_t sy = sign(dy);

    Position dominant = std::abs(dx) >= std::abs(dy) ? Position{sx, 0} : Position{0, sy};
    Position secondary = std::abs(dx) >= std::abs(dy) ? Position{0, sy} : Position{sx, 0};

    for (const Position& step : {Position{sx, sy}, dominant, secondary}) {
        if (step == Position{0, 0}) {
            continue;
        }
        if (can_move_to(get_x() + step.x, get_y() + step.y)) {
            return move(step.x, step.y);
        }
    }
    return false;
}

void Companion::enter(CompanionState state) {
    if (state != state_) {
        TILEWORLD_LOG_DEBUG(core::log_category::COMPANION, "Companion {} -> {}", companion_state_to_string(state_),
                            companion_state_to_string(state));
    }
    state_ = state;
}

}  // namespace tileworld::agents
