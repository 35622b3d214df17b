// TileWorld - Procedural tile world with wildlife and a companion
// main.cpp - Demo entry point

#include <tileworld/core/clock.hpp>
#include <tileworld/core/config.hpp>
#include <tileworld/core/logger.hpp>
#include <tileworld/sim/simulation.hpp>

#include <charconv>
#include <optional>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

namespace {

constexpr const char* VERSION = "0.1.0";
constexpr int32_t VIEW_RADIUS = 12;
constexpr uint64_t FRAME_MS = 50;

struct DemoOptions {
    std::optional<int64_t> seed;
    int ticks = 40;
    std::string config_path;
    bool debug = false;
};

template <typename T>
bool parse_number(std::string_view text, T& out) {
    auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), out);
    return error == std::errc{} && end == text.data() + text.size();
}

bool parse_options(int argc, char* argv[], DemoOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> std::string_view { return i + 1 < argc ? std::string_view(argv[++i]) : std::string_view{}; };

        if (arg == "--seed") {
            int64_t seed = 0;
            if (!parse_number(next(), seed)) {
                return false;
            }
            options.seed = seed;
        } else if (arg == "--ticks") {
            if (!parse_number(next(), options.ticks) || options.ticks < 0) {
                return false;
            }
        } else if (arg == "--config") {
            options.config_path = std::string(next());
            if (options.config_path.empty()) {
                return false;
            }
        } else if (arg == "--debug") {
            options.debug = true;
        } else {
            return false;
        }
    }
    return true;
}

void print_usage(const char* program) {
    std::printf("usage: %s [--seed N] [--ticks N] [--config FILE] [--debug]\n", program);
}

void print_view(const tileworld::sim::Simulation& simulation) {
    const auto* player = simulation.get_player();
    tileworld::world::WorldBounds area{player->get_x() - VIEW_RADIUS, player->get_x() + VIEW_RADIUS,
                                       player->get_y() - VIEW_RADIUS, player->get_y() + VIEW_RADIUS};

    auto rows = simulation.render_view(area);
    for (size_t row = 0; row < rows.size(); ++row) {
        std::string line;
        for (size_t column = 0; column < rows[row].size(); ++column) {
            const int32_t x = area.min_x + static_cast<int32_t>(column);
            const int32_t y = area.min_y + static_cast<int32_t>(row);
            if (x == player->get_x() && y == player->get_y()) {
                line += "@";
            } else {
                line += rows[row][column].symbol;
            }
        }
        std::printf("%s\n", line.c_str());
    }
}

void print_statistics(const tileworld::sim::Simulation& simulation) {
    using tileworld::world::TerrainKind;
    auto stats = simulation.get_world().get_terrain_statistics();
    std::printf("\nTerrain (every %d tiles, %zu samples):\n", stats.sample_step, stats.total_samples);
    for (size_t i = 0; i < tileworld::world::TERRAIN_KIND_COUNT; ++i) {
        auto kind = static_cast<TerrainKind>(i);
        if (stats.count(kind) > 0) {
            std::printf("  %-10s %5zu  %5.1f%%\n", tileworld::world::terrain_kind_to_string(kind), stats.count(kind),
                        stats.percentage(kind));
        }
    }

    auto counts = simulation.get_deer_manager().get_state_counts();
    std::printf("Deer: %zu wandering, %zu alert, %zu fleeing\n", counts.wandering, counts.alert, counts.fleeing);
    if (const auto* dog = simulation.get_companion_manager().get_companion()) {
        std::printf("Companion at (%d, %d), %s\n", dog->get_x(), dog->get_y(),
                    tileworld::agents::companion_state_to_string(dog->get_state()));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace tileworld;

    DemoOptions options;
    if (!parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return 2;
    }

    core::LoggerConfig log_config;
    log_config.console_level = options.debug ? core::LogLevel::Debug : core::LogLevel::Info;
    core::Logger::initialize(log_config);
    TILEWORLD_LOG_INFO(core::log_category::ENGINE, "TileWorld v{} starting", VERSION);

    core::Config config;
    if (!options.config_path.empty() && !config.load(options.config_path)) {
        TILEWORLD_LOG_ERROR(core::log_category::ENGINE, "Could not load configuration from {}", options.config_path);
        core::Logger::shutdown();
        return 1;
    }
    if (options.seed) {
        config.set_value(core::config_section::WORLD, core::config_key::SEED, *options.seed);
    }
    core::Logger::set_global_level(
        core::log_level_from_string(config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info")));
    if (options.debug) {
        core::Logger::set_global_level(core::LogLevel::Debug);
    }

    core::ManualClock clock;
    sim::Simulation simulation(config, clock);
    if (auto status = simulation.initialize(); !status) {
        TILEWORLD_LOG_CRITICAL(core::log_category::ENGINE, "Initialization failed: {}", status.to_string());
        core::Logger::shutdown();
        return 1;
    }
    if (options.debug) {
        simulation.toggle_deer_debug();
    }

    // Walk the player east and back while agents tick on virtual time
    const int32_t directions[2] = {1, -1};
    for (int tick = 0; tick < options.ticks; ++tick) {
        int32_t dx = directions[(tick / 10) % 2];
        if (!simulation.move_player(dx, 0)) {
            simulation.move_player(0, 1);
        }
        if (tick == options.ticks / 2) {
            simulation.call_companion();
        }
        for (uint64_t elapsed = 0; elapsed < 250; elapsed += FRAME_MS) {
            clock.advance(FRAME_MS);
            simulation.update();
        }
    }

    print_view(simulation);
    print_statistics(simulation);
    if (!simulation.get_last_message().empty()) {
        std::printf("Last message: %s\n", simulation.get_last_message().c_str());
    }

    simulation.shutdown();
    core::Logger::shutdown();
    return 0;
}
