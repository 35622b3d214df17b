// TileWorld Agents
// companion_manager.cpp - Companion spawning, ticking and rendering

#include <algorithm>
#include <cstdlib>
#include <tileworld/agents/companion_manager.hpp>
#include <tileworld/core/logger.hpp>

#include <spdlog/fmt/fmt.h>

#include <nlohmann/json.hpp>

namespace tileworld::agents {

using world::Position;

CompanionConfig load_companion_config(const core::Config& config) {
    const auto& section = config.section(core::config_section::COMPANION);
    CompanionConfig companion;
    companion.follow_distance = section.value("follow_distance", companion.follow_distance);
    companion.idle_timeout_ticks = section.value("idle_timeout_ticks", companion.idle_timeout_ticks);
    companion.spawn_position.x = section.value("spawn_x", companion.spawn_position.x);
    companion.spawn_position.y = section.value("spawn_y", companion.spawn_position.y);
    companion.spawn_search_radius = section.value("spawn_search_radius", companion.spawn_search_radius);
    companion.default_player.x = section.value("default_player_x", companion.default_player.x);
    companion.default_player.y = section.value("default_player_y", companion.default_player.y);
    companion.update_interval_ms = config.get_int(core::config_section::PERFORMANCE,
                                                  core::config_key::COMPANION_UPDATE_INTERVAL_MS,
                                                  static_cast<int>(companion.update_interval_ms));
    return companion;
}

core::Status validate_companion_config(const CompanionConfig& config) {
    if (config.follow_distance < 0 || config.spawn_search_radius < 0) {
        return core::Status::error(core::ErrorCode::ConfigurationInvalid,
                                   fmt::format("follow distance {} and spawn search radius {} must not be negative",
                                               config.follow_distance, config.spawn_search_radius),
                                   "companion");
    }
    if (config.idle_timeout_ticks < 1 || config.update_interval_ms == 0) {
        return core::Status::error(core::ErrorCode::ConfigurationInvalid,
                                   "idle timeout and tick interval must be positive", "companion");
    }
    return core::Status::ok();
}

CompanionManager::CompanionManager(world::World& world, const CompanionConfig& config)
    : world_(world), config_(config) {}

CompanionManager::~CompanionManager() {
    detach();
}

bool CompanionManager::spawn() {
    return spawn_near(config_.spawn_position);
}

bool CompanionManager::spawn_near(const Position& position) {
    // Rings of increasing Chebyshev radius
    for (int32_t ring = 0; ring <= config_.spawn_search_radius; ++ring) {
        for (int32_t dy = -ring; dy <= ring; ++dy) {
            for (int32_t dx = -ring; dx <= ring; ++dx) {
                if (std::max(std::abs(dx), std::abs(dy)) != ring) {
                    continue;
                }
                Position candidate{position.x + dx, position.y + dy};
                const entity::MovableEntity footing(world_, candidate);
                if (!footing.can_move_to(candidate.x, candidate.y)) {
                    continue;
                }
                companion_.emplace(world_, candidate, config_);
                TILEWORLD_LOG_INFO(core::log_category::COMPANION, "Companion spawned at ({}, {})", candidate.x,
                                   candidate.y);
                return true;
            }
        }
    }

    TILEWORLD_LOG_WARN(core::log_category::COMPANION, "No passable tile within {} of ({}, {}) for the companion",
                       config_.spawn_search_radius, position.x, position.y);
    return false;
}

void CompanionManager::despawn() {
    companion_.reset();
}

bool CompanionManager::call_companion() {
    if (!companion_) {
        return false;
    }
    companion_->come();
    return true;
}

void CompanionManager::set_player_locator(PlayerLocator locator) {
    player_locator_ = std::move(locator);
}

Position CompanionManager::current_player_position() const {
    std::optional<Position> player;
    if (player_locator_) {
        player = player_locator_();
    }
    if (!player) {
        TILEWORLD_LOG_WARN(core::log_category::COMPANION, "Player position unavailable, using default ({}, {})",
                           config_.default_player.x, config_.default_player.y);
        return config_.default_player;
    }
    return *player;
}

void CompanionManager::update(uint64_t tick) {
    if (!companion_) {
        return;
    }
    const Position player = current_player_position();
    try {
        companion_->update(player, tick);
    } catch (const std::exception& e) {
        TILEWORLD_LOG_ERROR(core::log_category::COMPANION, "Companion failed on tick {}: {}", tick, e.what());
    }
}

bool CompanionManager::attach(core::TickScheduler& scheduler) {
    detach();
    ticker_ = scheduler.add_ticker("companion", config_.update_interval_ms, [this](uint64_t tick) { update(tick); });
    if (ticker_ == core::INVALID_TICKER) {
        return false;
    }
    scheduler_ = &scheduler;
    return true;
}

void CompanionManager::detach() {
    if (scheduler_ != nullptr && ticker_ != core::INVALID_TICKER) {
        scheduler_->stop(ticker_);
    }
    scheduler_ = nullptr;
    ticker_ = core::INVALID_TICKER;
}

void CompanionManager::set_config(const CompanionConfig& config) {
    const bool interval_changed = config.update_interval_ms != config_.update_interval_ms;
    config_ = config;
    if (companion_) {
        companion_->set_config(config_);
    }

    core::TickScheduler* scheduler = scheduler_;
    if (interval_changed && scheduler != nullptr && !attach(*scheduler)) {
        TILEWORLD_LOG_ERROR(core::log_category::COMPANION, "Could not re-register the companion ticker at {} ms",
                            config_.update_interval_ms);
    }
    TILEWORLD_LOG_INFO(core::log_category::COMPANION, "Companion settings updated, ticking every {} ms",
                       config_.update_interval_ms);
}

world::RenderedCell CompanionManager::render(const Position& position, const world::RenderedCell& base) const {
    if (!companion_ || companion_->get_position() != position) {
        return base;
    }
    if (base.feature && base.feature->type == world::FeatureType::TreeCanopy) {
        return base;
    }

    world::RenderedCell rendered = base;
    rendered.symbol = "♥";
    rendered.display_name = "Companion";
    rendered.style_tag = std::string("companion-dog companion-") + companion_state_to_string(companion_->get_state());
    rendered.companion = true;
    return rendered;
}

}  // namespace tileworld::agents
