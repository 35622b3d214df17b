// TileWorld Agents
// deer.cpp - Deer state machine and line of sight

#include <algorithm>
#include <cmath>
#include <tileworld/agents/deer.hpp>
#include <tileworld/core/logger.hpp>
#include <tileworld/world/noise.hpp>
#include <tileworld/world/world.hpp>

namespace tileworld::agents {

using world::Position;

namespace {

constexpr uint32_t MOVE_CHANCE_CHANNEL = 0;
constexpr uint32_t DIRECTION_CHANNEL = 1;
constexpr uint64_t CHANNELS_PER_TICK = 4;

int32_t sign(int32_t value) {
    return (value > 0) - (value < 0);
}

}  // namespace

const char* deer_state_to_string(DeerState state) {
    switch (state) {
        case DeerState::Wandering:
            return "wandering";
        case DeerState::Alert:
            return "alert";
        case DeerState::Fleeing:
            return "fleeing";
        default:
            return "unknown";
    }
}

std::optional<DeerState> deer_state_from_string(std::string_view name) {
    for (uint8_t i = 0; i < static_cast<uint8_t>(DeerState::Count); ++i) {
        auto state = static_cast<DeerState>(i);
        if (name == deer_state_to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

Deer::Deer(world::World& world, uint32_t id, const Position& position, const DeerConfig& config, int64_t seed)
    : MovableEntity(world, position), id_(id), config_(config),
      seed_(static_cast<int64_t>(world::mix_seed(static_cast<uint64_t>(seed), id))) {}

// ============================================================================
// Perception
// ============================================================================

bool Deer::can_see_position(int32_t x, int32_t y) const {
    const world::World& world = get_world();
    if (!world.is_in_bounds(x, y)) {
        return false;
    }
    if (world::euclidean_distance(get_position(), Position{x, y}) > config_.vision_range) {
        return false;
    }

    // Bresenham walk, endpoints excluded
    int32_t cx = get_x();
    int32_t cy = get_y();
    const int32_t dx = std::abs(x - cx);
    const int32_t dy = -std::abs(y - cy);
    const int32_t sx = cx < x ? 1 : -1;
    const int32_t sy = cy < y ? 1 : -1;
    int32_t error = dx + dy;

    while (true) {
        if (cx == x && cy == y) {
            return true;
        }
        int32_t doubled = 2 * error;
        if (doubled >= dy) {
            error += dy;
            cx += sx;
        }
        if (doubled <= dx) {
            error += dx;
            cy += sy;
        }
        if (cx == x && cy == y) {
            return true;
        }
        if (!world.is_in_bounds(cx, cy) || world.get_bounds().is_boundary(cx, cy)) {
            return false;
        }
        auto feature = world.get_feature_at(cx, cy);
        if (feature && world::blocks_sight(*feature)) {
            return false;
        }
    }
}

std::vector<Position> Deer::get_visible_tiles() const {
    std::vector<Position> tiles;
    const int32_t range = config_.vision_range;
    for (int32_t dy = -range; dy <= range; ++dy) {
        for (int32_t dx = -range; dx <= range; ++dx) {
            if (can_see_position(get_x() + dx, get_y() + dy)) {
                tiles.emplace_back(get_x() + dx, get_y() + dy);
            }
        }
    }
    return tiles;
}

// ============================================================================
// State Machine
// ============================================================================

void Deer::update(const Position& player, const std::vector<const Deer*>& peers, uint64_t tick) {
    last_decision_tick_ = tick;

    const bool sees_player = can_see_position(player.x, player.y);
    const double distance = world::euclidean_distance(get_position(), player);

    switch (state_) {
        case DeerState::Wandering: {
            if (sees_player) {
                enter(DeerState::Alert);
                face(player);
                return;
            }
            bool herd_fleeing = std::any_of(peers.begin(), peers.end(), [this](const Deer* peer) {
                return peer != this && peer->get_state() == DeerState::Fleeing &&
                       world::euclidean_distance(peer->get_position(), get_position()) <= config_.herd_alert_radius;
            });
            if (herd_fleeing) {
                enter(DeerState::Alert);
                return;
            }
            wander(tick);
            return;
        }

        case DeerState::Alert: {
            face(player);
            if (!sees_player) {
                close_ticks_ = 0;
                if (++unseen_ticks_ >= config_.lose_sight_ticks) {
                    enter(DeerState::Wandering);
                }
                return;
            }
            unseen_ticks_ = 0;
            if (distance <= config_.panic_distance) {
                enter(DeerState::Fleeing);
                flee(player, peers);
                return;
            }
            if (distance < config_.alert_range) {
                if (++close_ticks_ >= config_.alert_confirm_ticks) {
                    enter(DeerState::Fleeing);
                    flee(player, peers);
                }
            } else {
                close_ticks_ = 0;
            }
            return;
        }

        case DeerState::Fleeing: {
            if (sees_player) {
                unseen_ticks_ = 0;
            } else if (++unseen_ticks_ >= config_.flee_calm_ticks) {
                enter(DeerState::Wandering);
                return;
            }
            flee(player, peers);
            return;
        }

        default:
            return;
    }
}

void Deer::wander(uint64_t tick) {
    target_.reset();
    if (roll(tick, MOVE_CHANCE_CHANNEL) >= config_.wander_move_chance) {
        return;
    }

    std::vector<Position> options;
    for (const auto& offset : world::NEIGHBOR_OFFSETS) {
        Position next = get_position() + offset;
        if (can_move_to(next.x, next.y)) {
            options.push_back(next);
        }
    }
    if (options.empty()) {
        return;
    }

    auto index = static_cast<size_t>(roll(tick, DIRECTION_CHANNEL) * static_cast<double>(options.size()));
    Position next = options[std::min(index, options.size() - 1)];
    target_ = next;
    face(next);
    move(next.x - get_x(), next.y - get_y());
}

void Deer::flee(const Position& threat, const std::vector<const Deer*>& peers) {
    auto crowded = [&](const Position& pos) {
        return std::any_of(peers.begin(), peers.end(), [&](const Deer* peer) {
            return peer != this && world::euclidean_distance(peer->get_position(), pos) < config_.min_spacing;
        });
    };

    std::vector<Position> open;
    std::vector<Position> spaced;
    for (const auto& offset : world::NEIGHBOR_OFFSETS) {
        Position next = get_position() + offset;
        if (!can_move_to(next.x, next.y)) {
            continue;
        }
        open.push_back(next);
        if (!crowded(next)) {
            spaced.push_back(next);
        }
    }

    // Keep spacing from the herd when any option allows it
    const std::vector<Position>& options = spaced.empty() ? open : spaced;
    const double current = world::euclidean_distance(get_position(), threat);

    std::optional<Position> best;
    double best_distance = current;
    for (const auto& option : options) {
        double distance = world::euclidean_distance(option, threat);
        if (distance > best_distance) {
            best = option;
            best_distance = distance;
        }
    }

    target_ = best;
    if (best) {
        move(best->x - get_x(), best->y - get_y());
    }
}

void Deer::scare(const Position& threat) {
    enter(DeerState::Fleeing);
    face(threat);
}

void Deer::calm() {
    enter(DeerState::Wandering);
    target_.reset();
}

void Deer::enter(DeerState state) {
    if (state != state_) {
        TILEWORLD_LOG_DEBUG(core::log_category::WILDLIFE, "Deer {} {} -> {}", id_, deer_state_to_string(state_),
                            deer_state_to_string(state));
    }
    state_ = state;
    close_ticks_ = 0;
    unseen_ticks_ = 0;
}

void Deer::face(const Position& target) {
    Position direction{sign(target.x - get_x()), sign(target.y - get_y())};
    if (direction != Position{0, 0}) {
        facing_ = direction;
    }
}

double Deer::roll(uint64_t tick, uint32_t channel) const {
    return world::random_unit(seed_, static_cast<int64_t>(tick * CHANNELS_PER_TICK + channel));
}

}  // namespace tileworld::agents
