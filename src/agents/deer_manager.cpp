// TileWorld Agents
// deer_manager.cpp - Herd spawning, ticking and rendering

#include <algorithm>
#include <tileworld/agents/deer_manager.hpp>
#include <tileworld/core/logger.hpp>
#include <tileworld/entity/movable_entity.hpp>
#include <tileworld/world/noise.hpp>

#include <spdlog/fmt/fmt.h>

#include <nlohmann/json.hpp>

namespace tileworld::agents {

using world::Position;

namespace {

constexpr int64_t SPAWN_SALT = 0x44454552;

}  // namespace

DeerConfig load_deer_config(const core::Config& config) {
    const auto& section = config.section(core::config_section::DEER);
    DeerConfig deer;
    deer.deer_count = section.value("deer_count", deer.deer_count);
    deer.spawn_attempts = section.value("spawn_attempts", deer.spawn_attempts);
    deer.spawn_margin = section.value("spawn_margin", deer.spawn_margin);
    deer.min_spacing = section.value("min_spacing", deer.min_spacing);
    deer.vision_range = section.value("vision_range", deer.vision_range);
    deer.alert_range = section.value("alert_range", deer.alert_range);
    deer.panic_distance = section.value("panic_distance", deer.panic_distance);
    deer.alert_confirm_ticks = section.value("alert_confirm_ticks", deer.alert_confirm_ticks);
    deer.lose_sight_ticks = section.value("lose_sight_ticks", deer.lose_sight_ticks);
    deer.flee_calm_ticks = section.value("flee_calm_ticks", deer.flee_calm_ticks);
    deer.wander_move_chance = section.value("wander_move_chance", deer.wander_move_chance);
    deer.herd_alert_radius = section.value("herd_alert_radius", deer.herd_alert_radius);
    deer.default_player.x = section.value("default_player_x", deer.default_player.x);
    deer.default_player.y = section.value("default_player_y", deer.default_player.y);

    deer.update_interval_ms = config.get_int(core::config_section::PERFORMANCE,
                                             core::config_key::DEER_UPDATE_INTERVAL_MS,
                                             static_cast<int>(deer.update_interval_ms));
    deer.debug = config.get_bool(core::config_section::DEBUG, "deer_debug", deer.debug);
    return deer;
}

core::Status validate_deer_config(const DeerConfig& config) {
    auto invalid = [](std::string message) {
        return core::Status::error(core::ErrorCode::ConfigurationInvalid, std::move(message), "deer");
    };

    if (config.deer_count < 0 || config.spawn_attempts < 0 || config.spawn_margin < 0 || config.min_spacing < 0.0f) {
        return invalid("deer counts, spawn margin and spacing must not be negative");
    }
    if (config.vision_range < 0 || config.panic_distance < 0 || config.panic_distance > config.alert_range) {
        return invalid(fmt::format("need 0 <= panic_distance ({}) <= alert_range ({}) and a non-negative vision range",
                                   config.panic_distance, config.alert_range));
    }
    if (config.alert_confirm_ticks < 1 || config.lose_sight_ticks < 1 || config.flee_calm_ticks < 1) {
        return invalid("deer tick counts must be at least 1");
    }
    if (config.wander_move_chance < 0.0f || config.wander_move_chance > 1.0f) {
        return invalid(fmt::format("wander_move_chance {} outside [0, 1]", config.wander_move_chance));
    }
    if (config.herd_alert_radius < 0.0f || config.update_interval_ms == 0) {
        return invalid("herd alert radius must not be negative and the tick interval must be positive");
    }
    return core::Status::ok();
}

DeerManager::DeerManager(world::World& world, const DeerConfig& config) : world_(world), config_(config) {}

DeerManager::~DeerManager() {
    detach();
}

// ============================================================================
// Spawning
// ============================================================================

bool DeerManager::is_spawnable(const Position& position) const {
    // Deer move under the default rules
    const entity::MovableEntity footing(world_, position);
    if (!footing.can_move_to(position.x, position.y)) {
        return false;
    }
    if (world::is_water(world_.get_terrain_at(position.x, position.y).terrain)) {
        return false;
    }
    return std::none_of(deer_.begin(), deer_.end(), [&](const Deer& deer) {
        return world::euclidean_distance(deer.get_position(), position) < config_.min_spacing;
    });
}

SpawnReport DeerManager::spawn_deer() {
    const world::WorldBounds& bounds = world_.get_bounds();

    // The margin shrinks on small worlds so the spawn area stays non-empty
    int32_t margin_x = std::min(config_.spawn_margin, (bounds.max_x - bounds.min_x) / 2);
    int32_t margin_y = std::min(config_.spawn_margin, (bounds.max_y - bounds.min_y) / 2);
    const int64_t seed = world_.get_seed() + static_cast<int64_t>(spawn_generation_) * 7919;

    SpawnReport report;
    report.requested = static_cast<size_t>(std::max(config_.deer_count, 0));

    while (report.placed < report.requested && report.attempts < static_cast<size_t>(config_.spawn_attempts)) {
        const int64_t sample = seed + static_cast<int64_t>(report.attempts) * 1000;
        ++report.attempts;

        Position candidate{world::random_int(sample, SPAWN_SALT, bounds.min_x + margin_x, bounds.max_x - margin_x),
                           world::random_int(sample + 1, SPAWN_SALT, bounds.min_y + margin_y, bounds.max_y - margin_y)};
        if (!is_spawnable(candidate)) {
            continue;
        }
        deer_.emplace_back(world_, next_id_++, candidate, config_, world_.get_seed());
        ++report.placed;
    }

    ++spawn_generation_;
    last_spawn_ = report;

    if (report.is_shortfall()) {
        TILEWORLD_LOG_INFO(core::log_category::WILDLIFE, "Spawned {} of {} deer after {} attempts", report.placed,
                           report.requested, report.attempts);
    } else {
        TILEWORLD_LOG_INFO(core::log_category::WILDLIFE, "Spawned {} deer ({} attempts)", report.placed,
                           report.attempts);
    }
    return report;
}

SpawnReport DeerManager::respawn_deer() {
    deer_.clear();
    return spawn_deer();
}

bool DeerManager::place_deer(const Position& position) {
    const entity::MovableEntity footing(world_, position);
    if (!footing.can_move_to(position.x, position.y) ||
        world::is_water(world_.get_terrain_at(position.x, position.y).terrain)) {
        return false;
    }
    deer_.emplace_back(world_, next_id_++, position, config_, world_.get_seed());
    return true;
}

void DeerManager::clear() {
    deer_.clear();
}

// ============================================================================
// Ticking
// ============================================================================

void DeerManager::set_player_locator(PlayerLocator locator) {
    player_locator_ = std::move(locator);
}

Position DeerManager::current_player_position() const {
    std::optional<Position> player;
    if (player_locator_) {
        player = player_locator_();
    }
    if (!player) {
        TILEWORLD_LOG_WARN(core::log_category::WILDLIFE, "Player position unavailable, using default ({}, {})",
                           config_.default_player.x, config_.default_player.y);
        return config_.default_player;
    }
    return *player;
}

void DeerManager::update(uint64_t tick) {
    if (deer_.empty()) {
        return;
    }
    const Position player = current_player_position();

    std::vector<const Deer*> peers;
    peers.reserve(deer_.size());
    for (const auto& deer : deer_) {
        peers.push_back(&deer);
    }

    for (auto& deer : deer_) {
        try {
            deer.update(player, peers, tick);
        } catch (const std::exception& e) {
            TILEWORLD_LOG_ERROR(core::log_category::WILDLIFE, "Deer {} failed on tick {}: {}", deer.get_id(), tick,
                                e.what());
        }
    }
}

bool DeerManager::attach(core::TickScheduler& scheduler) {
    detach();
    ticker_ = scheduler.add_ticker("deer", config_.update_interval_ms, [this](uint64_t tick) { update(tick); });
    if (ticker_ == core::INVALID_TICKER) {
        return false;
    }
    scheduler_ = &scheduler;
    return true;
}

void DeerManager::detach() {
    if (scheduler_ != nullptr && ticker_ != core::INVALID_TICKER) {
        scheduler_->stop(ticker_);
    }
    scheduler_ = nullptr;
    ticker_ = core::INVALID_TICKER;
}

void DeerManager::set_config(const DeerConfig& config) {
    const bool interval_changed = config.update_interval_ms != config_.update_interval_ms;
    config_ = config;
    for (auto& deer : deer_) {
        deer.set_config(config_);
    }

    core::TickScheduler* scheduler = scheduler_;
    if (interval_changed && scheduler != nullptr && !attach(*scheduler)) {
        TILEWORLD_LOG_ERROR(core::log_category::WILDLIFE, "Could not re-register the deer ticker at {} ms",
                            config_.update_interval_ms);
    }
    TILEWORLD_LOG_INFO(core::log_category::WILDLIFE, "Deer settings updated for {} deer, ticking every {} ms",
                       deer_.size(), config_.update_interval_ms);
}

// ============================================================================
// Rendering and queries
// ============================================================================

world::RenderedCell DeerManager::render(const Position& position, const world::RenderedCell& base) const {
    if (base.feature && base.feature->type == world::FeatureType::TreeCanopy) {
        return base;
    }
    const Deer* deer = get_deer_at(position);
    if (deer == nullptr) {
        return base;
    }

    const DeerState state = deer->get_state();
    world::RenderedCell rendered = base;
    rendered.symbol = config_.debug && state == DeerState::Alert ? "♢" : "♦";
    rendered.display_name = std::string("Deer (") + deer_state_to_string(state) + ")";
    rendered.style_tag = "deer-entity";
    if (state == DeerState::Fleeing) {
        rendered.style_tag += " deer-fleeing";
    }
    if (config_.debug && state == DeerState::Alert) {
        rendered.style_tag += " deer-alert";
    }
    rendered.deer = deer->get_id();
    return rendered;
}

const Deer* DeerManager::get_deer_at(const Position& position) const {
    for (const auto& deer : deer_) {
        if (deer.get_position() == position) {
            return &deer;
        }
    }
    return nullptr;
}

std::vector<const Deer*> DeerManager::get_deer_near(const Position& position, double radius) const {
    std::vector<const Deer*> nearby;
    for (const auto& deer : deer_) {
        if (world::euclidean_distance(deer.get_position(), position) <= radius) {
            nearby.push_back(&deer);
        }
    }
    return nearby;
}

DeerStateCounts DeerManager::get_state_counts() const {
    DeerStateCounts counts;
    for (const auto& deer : deer_) {
        switch (deer.get_state()) {
            case DeerState::Wandering:
                ++counts.wandering;
                break;
            case DeerState::Alert:
                ++counts.alert;
                break;
            case DeerState::Fleeing:
                ++counts.fleeing;
                break;
            default:
                break;
        }
    }
    return counts;
}

void DeerManager::scare_all(const Position& threat) {
    for (auto& deer : deer_) {
        deer.scare(threat);
    }
}

void DeerManager::calm_all() {
    for (auto& deer : deer_) {
        deer.calm();
    }
}

// ============================================================================
// Debug
// ============================================================================

bool DeerManager::toggle_debug_mode() {
    config_.debug = !config_.debug;
    TILEWORLD_LOG_INFO(core::log_category::WILDLIFE, "Deer debug mode {}", config_.debug ? "on" : "off");
    return config_.debug;
}

std::vector<DeerDebugInfo> DeerManager::get_debug_info() const {
    std::vector<DeerDebugInfo> info;
    info.reserve(deer_.size());
    for (const auto& deer : deer_) {
        DeerDebugInfo entry;
        entry.id = deer.get_id();
        entry.position = deer.get_position();
        entry.state = deer.get_state();
        entry.vision_range = deer.get_vision_range();
        entry.last_decision_tick = deer.get_last_decision_tick();
        entry.target = deer.get_target();
        info.push_back(entry);
    }
    return info;
}

std::unordered_set<Position> DeerManager::get_visible_tiles() const {
    std::unordered_set<Position> tiles;
    for (const auto& deer : deer_) {
        for (const auto& tile : deer.get_visible_tiles()) {
            tiles.insert(tile);
        }
    }
    return tiles;
}

}  // namespace tileworld::agents
