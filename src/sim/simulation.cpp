// TileWorld Simulation
// simulation.cpp - Wires world, player and agent managers behind the command surface

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstdlib>
#include <tileworld/core/logger.hpp>
#include <tileworld/sim/simulation.hpp>

namespace tileworld::sim {

using world::Position;

namespace {

constexpr int32_t PLAYER_SEARCH_RADIUS = 25;

core::TickSchedulerConfig scheduler_config(const core::Config& config) {
    core::TickSchedulerConfig scheduler;
    scheduler.max_catch_up_ticks = static_cast<uint32_t>(std::max(
        0, config.get_int(core::config_section::PERFORMANCE, "max_catch_up_ticks",
                          static_cast<int>(scheduler.max_catch_up_ticks))));
    return scheduler;
}

bool is_terrain_section(std::string_view section) {
    return section == core::config_section::TERRAIN_TYPES || section == core::config_section::CLASSIFIER ||
           section == core::config_section::TREES;
}

// Chebyshev rings of increasing radius, rows top to bottom within a ring
template <typename Accept>
std::optional<Position> search_rings(const Position& origin, int32_t max_radius, Accept&& accept) {
    for (int32_t ring = 0; ring <= max_radius; ++ring) {
        for (int32_t dy = -ring; dy <= ring; ++dy) {
            for (int32_t dx = -ring; dx <= ring; ++dx) {
                if (std::max(std::abs(dx), std::abs(dy)) != ring) {
                    continue;
                }
                if (accept(origin.x + dx, origin.y + dy)) {
                    return Position{origin.x + dx, origin.y + dy};
                }
            }
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<Position> find_nearest_passable(const world::World& world, const Position& origin,
                                              int32_t max_radius) {
    return search_rings(origin, max_radius, [&world](int32_t x, int32_t y) { return world.is_passable(x, y); });
}

std::optional<Position> find_nearest_footing(const entity::MovableEntity& entity, const Position& origin,
                                             int32_t max_radius) {
    return search_rings(origin, max_radius, [&entity](int32_t x, int32_t y) { return entity.can_move_to(x, y); });
}

// ============================================================================
// Implementation Details
// ============================================================================

struct Simulation::Impl {
    core::Config& config;
    world::World world;
    core::TickScheduler scheduler;
    agents::DeerManager deer;
    agents::CompanionManager companion;
    std::unique_ptr<entity::Player> player;
    std::string last_message;
    bool initialized = false;

    Impl(core::Config& c, const core::MonotonicClock& clock, world::ModuleRegistry registry)
        : config(c),
          world(c, std::move(registry)),
          scheduler(clock, scheduler_config(c)),
          deer(world, agents::load_deer_config(c)),
          companion(world, agents::load_companion_config(c)) {}

    [[nodiscard]] std::optional<Position> player_position() const {
        if (!player) {
            return std::nullopt;
        }
        return player->get_position();
    }

    void reveal_around_player() {
        const int32_t radius = world.get_performance_config().exploration_radius;
        const Position center = player->get_position();
        for (int32_t dy = -radius; dy <= radius; ++dy) {
            for (int32_t dx = -radius; dx <= radius; ++dx) {
                if (dx * dx + dy * dy <= radius * radius) {
                    // Materialise the cell so it can be marked
                    (void)world.get_terrain_at(center.x + dx, center.y + dy);
                }
            }
        }
        world.mark_discovered_around(center, radius);
    }

    bool place_player() {
        auto candidate = std::make_unique<entity::Player>(world);
        auto start = find_nearest_footing(*candidate, entity::Player::DEFAULT_POSITION, PLAYER_SEARCH_RADIUS);
        if (!start) {
            TILEWORLD_LOG_ERROR(core::log_category::ENGINE, "No tile near ({}, {}) the player may stand on",
                                entity::Player::DEFAULT_POSITION.x, entity::Player::DEFAULT_POSITION.y);
            return false;
        }
        candidate->set_position(*start);
        player = std::move(candidate);
        player->set_blocked_handler(
            [this](const entity::MovableEntity&, const Position&, const std::string& reason) { last_message = reason; });
        return true;
    }

    // Agents left on tiles their rules no longer allow are moved
    void relocate_agents() {
        if (player && !player->can_move_to(player->get_x(), player->get_y())) {
            if (auto spot = find_nearest_footing(*player, player->get_position(), PLAYER_SEARCH_RADIUS)) {
                TILEWORLD_LOG_INFO(core::log_category::ENGINE, "Player moved from ({}, {}) to ({}, {})",
                                   player->get_x(), player->get_y(), spot->x, spot->y);
                player->set_position(*spot);
            } else {
                TILEWORLD_LOG_WARN(core::log_category::ENGINE, "No tile within {} of ({}, {}) the player may stand on",
                                   PLAYER_SEARCH_RADIUS, player->get_x(), player->get_y());
            }
        }

        bool herd_stranded = std::any_of(deer.get_deer().begin(), deer.get_deer().end(), [](const auto& d) {
            return !d.can_move_to(d.get_x(), d.get_y());
        });
        if (herd_stranded) {
            (void)deer.respawn_deer();
        }

        const agents::Companion* dog = companion.get_companion();
        if (dog != nullptr && !dog->can_move_to(dog->get_x(), dog->get_y())) {
            const Position near = dog->get_position();
            bool placed = companion.spawn_near(near) || (player && companion.spawn_near(player->get_position()));
            if (!placed) {
                TILEWORLD_LOG_WARN(core::log_category::COMPANION, "Companion removed: nowhere to stand near ({}, {})",
                                   near.x, near.y);
                companion.despawn();
            }
        }

        if (player) {
            reveal_around_player();
        }
    }

    // Push agent sections into the running managers and scheduler
    core::Status apply_agent_settings(std::string_view section) {
        const bool performance = section == core::config_section::PERFORMANCE;
        const bool deer_section =
            performance || section == core::config_section::DEER || section == core::config_section::DEBUG;
        const bool companion_section = performance || section == core::config_section::COMPANION;
        if (!deer_section && !companion_section) {
            return core::Status::ok();
        }

        agents::DeerConfig deer_config;
        agents::CompanionConfig companion_config;
        try {
            deer_config = agents::load_deer_config(config);
            companion_config = agents::load_companion_config(config);
        } catch (const nlohmann::json::exception& e) {
            return core::Status::error(core::ErrorCode::ConfigurationInvalid,
                                       fmt::format("malformed '{}' value: {}", section, e.what()),
                                       std::string(section));
        }
        if (auto status = agents::validate_deer_config(deer_config); !status) {
            return status;
        }
        if (auto status = agents::validate_companion_config(companion_config); !status) {
            return status;
        }

        if (deer_section) {
            // The runtime debug toggle survives unrelated updates
            if (section != core::config_section::DEBUG) {
                deer_config.debug = deer.is_debug_mode();
            }
            deer.set_config(deer_config);
        }
        if (companion_section) {
            companion.set_config(companion_config);
        }
        if (performance) {
            scheduler.set_config(scheduler_config(config));
        }
        return core::Status::ok();
    }

    // Undo an accepted world update: drop keys it introduced, restore the rest
    void restore_section(std::string_view section, const nlohmann::json& previous, const nlohmann::json& values) {
        for (auto it = values.begin(); it != values.end(); ++it) {
            if (!previous.contains(it.key())) {
                config.remove(section, it.key());
            }
        }
        if (auto status = world.update_configuration(section, previous); !status) {
            TILEWORLD_LOG_ERROR(core::log_category::CONFIG, "Could not restore '{}': {}", section, status.message());
        }
    }
};

// ============================================================================
// Simulation
// ============================================================================

Simulation::Simulation(core::Config& config, const core::MonotonicClock& clock, world::ModuleRegistry registry)
    : impl_(std::make_unique<Impl>(config, clock, std::move(registry))) {}

Simulation::~Simulation() {
    shutdown();
}

core::Status Simulation::initialize() {
    if (auto status = impl_->world.initialize(); !status) {
        return status;
    }
    if (!impl_->place_player()) {
        return core::Status::error(core::ErrorCode::ConfigurationInvalid, "no passable tile for the player");
    }
    impl_->reveal_around_player();

    auto locator = [this]() { return impl_->player_position(); };
    impl_->deer.set_player_locator(locator);
    impl_->companion.set_player_locator(locator);

    impl_->deer.spawn_deer();
    impl_->companion.spawn();
    impl_->deer.attach(impl_->scheduler);
    impl_->companion.attach(impl_->scheduler);

    impl_->initialized = true;
    TILEWORLD_LOG_INFO(core::log_category::ENGINE, "Simulation ready: player at ({}, {}), {} deer",
                       impl_->player->get_x(), impl_->player->get_y(), impl_->deer.get_deer_count());
    return core::Status::ok();
}

void Simulation::shutdown() {
    if (!impl_ || !impl_->initialized) {
        return;
    }
    impl_->deer.detach();
    impl_->companion.detach();
    impl_->initialized = false;
}

bool Simulation::is_initialized() const {
    return impl_->initialized;
}

// ----------------------------------------------------------------------------
// Commands
// ----------------------------------------------------------------------------

bool Simulation::move_player(int32_t dx, int32_t dy) {
    if (!impl_->player) {
        return false;
    }
    if (!impl_->player->move(dx, dy)) {
        return false;
    }
    impl_->last_message.clear();
    impl_->reveal_around_player();
    return true;
}

bool Simulation::call_companion() {
    return impl_->companion.call_companion();
}

bool Simulation::toggle_deer_debug() {
    return impl_->deer.toggle_debug_mode();
}

core::Status Simulation::regenerate_world() {
    core::Status status = impl_->world.regenerate_world();
    if (status) {
        impl_->relocate_agents();
    }
    return status;
}

core::Status Simulation::regenerate_module(std::string_view name) {
    core::Status status = impl_->world.regenerate_module(name);
    if (status) {
        impl_->relocate_agents();
    }
    return status;
}

core::Status Simulation::apply_geological_preset(std::string_view name) {
    return impl_->world.apply_geological_preset(name);
}

core::Status Simulation::quick_config_elevation(std::string_view method) {
    return impl_->world.quick_config_elevation(method);
}

core::Status Simulation::quick_config_water(std::string_view level) {
    return impl_->world.quick_config_water(level);
}

core::Status Simulation::update_configuration(std::string_view section, const nlohmann::json& values) {
    const nlohmann::json previous = impl_->config.section(section);
    core::Status status = impl_->world.update_configuration(section, values);
    if (!status) {
        return status;
    }

    if (auto applied = impl_->apply_agent_settings(section); !applied) {
        TILEWORLD_LOG_WARN(core::log_category::CONFIG, "Rejected update to '{}': {}", section, applied.message());
        impl_->restore_section(section, previous, values);
        return applied;
    }
    if (is_terrain_section(section)) {
        impl_->relocate_agents();
    }
    return status;
}

size_t Simulation::update() {
    return impl_->scheduler.run_due();
}

// ----------------------------------------------------------------------------
// Views
// ----------------------------------------------------------------------------

world::RenderedCell Simulation::render_cell(int32_t x, int32_t y) const {
    const Position pos{x, y};
    world::RenderedCell cell = impl_->world.render_cell(x, y);
    cell = impl_->deer.render(pos, cell);
    cell = impl_->companion.render(pos, cell);
    return cell;
}

std::vector<std::vector<world::RenderedCell>> Simulation::render_view(const world::WorldBounds& area) const {
    std::vector<std::vector<world::RenderedCell>> rows;
    if (!area.is_valid()) {
        return rows;
    }
    rows.reserve(static_cast<size_t>(area.height()));
    for (int32_t y = area.min_y; y <= area.max_y; ++y) {
        std::vector<world::RenderedCell> row;
        row.reserve(static_cast<size_t>(area.width()));
        for (int32_t x = area.min_x; x <= area.max_x; ++x) {
            row.push_back(render_cell(x, y));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

nlohmann::json Simulation::export_world_state() const {
    return impl_->world.export_world_state();
}

const std::string& Simulation::get_last_message() const {
    return impl_->last_message;
}

// ----------------------------------------------------------------------------
// Subsystem access
// ----------------------------------------------------------------------------

world::World& Simulation::get_world() {
    return impl_->world;
}

const world::World& Simulation::get_world() const {
    return impl_->world;
}

entity::Player* Simulation::get_player() {
    return impl_->player.get();
}

const entity::Player* Simulation::get_player() const {
    return impl_->player.get();
}

agents::DeerManager& Simulation::get_deer_manager() {
    return impl_->deer;
}

const agents::DeerManager& Simulation::get_deer_manager() const {
    return impl_->deer;
}

agents::CompanionManager& Simulation::get_companion_manager() {
    return impl_->companion;
}

const agents::CompanionManager& Simulation::get_companion_manager() const {
    return impl_->companion;
}

core::TickScheduler& Simulation::get_scheduler() {
    return impl_->scheduler;
}

}  // namespace tileworld::sim
