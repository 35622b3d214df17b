// TileWorld Simulation Tests
// simulation_test.cpp - Tests for the command surface and tick wiring

#include <gtest/gtest.h>

#include <memory>
#include <tileworld/sim/simulation.hpp>

#include "painted_terrain.hpp"

namespace tileworld::sim {
namespace {

using world::Position;
using world::TerrainKind;

class SimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::use_painted_world(config_, world::WorldBounds{-30, 30, -30, 30});
        sim_ = std::make_unique<Simulation>(
            config_, clock_,
            test::painted_registry(test::plains_except([](int32_t x, int32_t) -> std::optional<TerrainKind> {
                if (x == 16) {
                    return TerrainKind::River;
                }
                return std::nullopt;
            })));
        ASSERT_TRUE(sim_->initialize());
    }

    core::Config config_;
    core::ManualClock clock_;
    std::unique_ptr<Simulation> sim_;
};

// Test: Initialization places the player, herd and companion
TEST_F(SimulationTest, InitializePlacesEverything) {
    EXPECT_TRUE(sim_->is_initialized());
    ASSERT_NE(sim_->get_player(), nullptr);
    EXPECT_EQ(sim_->get_player()->get_position(), Position(15, 15));
    EXPECT_GT(sim_->get_deer_manager().get_deer_count(), 0u);
    EXPECT_TRUE(sim_->get_companion_manager().has_companion());
    EXPECT_TRUE(sim_->get_deer_manager().is_attached());
    EXPECT_TRUE(sim_->get_companion_manager().is_attached());
    EXPECT_TRUE(sim_->get_world().get_terrain_at(15, 15).discovered);
    EXPECT_TRUE(sim_->get_world().get_terrain_at(15, 20).discovered);
}

// Test: A blocked move reports why
TEST_F(SimulationTest, BlockedMoveKeepsMessage) {
    EXPECT_FALSE(sim_->move_player(1, 0));
    EXPECT_EQ(sim_->get_player()->get_position(), Position(15, 15));
    EXPECT_EQ(sim_->get_last_message(), "Cannot walk on River");

    EXPECT_TRUE(sim_->move_player(-1, 0));
    EXPECT_TRUE(sim_->get_last_message().empty());
    EXPECT_EQ(sim_->get_player()->get_position(), Position(14, 15));
}

// Test: Moving reveals the cells around the player
TEST_F(SimulationTest, MoveRevealsSurroundings) {
    EXPECT_FALSE(sim_->get_world().get_terrain_at(15, 5).discovered);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(sim_->move_player(0, -1));
    }
    EXPECT_TRUE(sim_->get_world().get_terrain_at(15, 5).discovered);
}

// Test: Updates run the due agent tickers
TEST_F(SimulationTest, UpdateRunsAgentTickers) {
    EXPECT_EQ(sim_->update(), 0u);

    clock_.advance(200);
    EXPECT_EQ(sim_->update(), 1u) << "companion only";

    clock_.advance(550);
    EXPECT_EQ(sim_->update(), 3u) << "companion at 400 and 600, deer at 750";

    const agents::Companion* dog = sim_->get_companion_manager().get_companion();
    ASSERT_NE(dog, nullptr);
    EXPECT_EQ(dog->get_last_decision_tick(), 3u);
}

// Test: Shutdown stops every ticker
TEST_F(SimulationTest, ShutdownStopsTickers) {
    sim_->shutdown();
    EXPECT_FALSE(sim_->is_initialized());
    clock_.advance(5000);
    EXPECT_EQ(sim_->update(), 0u);
}

// Test: Calling the companion sends it toward the player
TEST_F(SimulationTest, CallCompanion) {
    EXPECT_TRUE(sim_->call_companion());
    EXPECT_EQ(sim_->get_companion_manager().get_companion()->get_state(), agents::CompanionState::Coming);
}

// Test: The deer debug overlay can be toggled
TEST_F(SimulationTest, ToggleDeerDebug) {
    EXPECT_TRUE(sim_->toggle_deer_debug());
    EXPECT_TRUE(sim_->get_deer_manager().is_debug_mode());
    EXPECT_FALSE(sim_->toggle_deer_debug());
}

// Test: The rendered view covers the requested area with agent overlays
TEST_F(SimulationTest, RenderViewLayout) {
    world::WorldBounds area{10, 20, 12, 18};
    auto rows = sim_->render_view(area);
    ASSERT_EQ(rows.size(), 7u);
    for (const auto& row : rows) {
        ASSERT_EQ(row.size(), 11u);
    }
    EXPECT_EQ(rows[0][6].terrain, TerrainKind::River);
    EXPECT_EQ(rows[0][0].terrain, TerrainKind::Plains);

    // Companion overlay at its spawn point
    const auto& companion_cell = rows[17 - 12][17 - 10];
    EXPECT_TRUE(companion_cell.companion);
    EXPECT_EQ(companion_cell.symbol, "♥");

    EXPECT_TRUE(sim_->render_view(world::WorldBounds{5, 4, 0, 0}).empty());
}

// Test: Deer appear in rendered cells
TEST_F(SimulationTest, RenderCellShowsDeer) {
    const auto& herd = sim_->get_deer_manager().get_deer();
    ASSERT_FALSE(herd.empty());
    Position pos = herd.front().get_position();
    world::RenderedCell cell = sim_->render_cell(pos.x, pos.y);
    EXPECT_EQ(cell.deer, std::optional<uint32_t>(herd.front().get_id()));
}

// Test: Regeneration and preset commands report unknown names
TEST_F(SimulationTest, RegenerateCommands) {
    EXPECT_TRUE(sim_->regenerate_world());
    EXPECT_EQ(sim_->regenerate_module("geology").code(), core::ErrorCode::UnknownModule);
    EXPECT_TRUE(sim_->regenerate_module("painted"));
    EXPECT_EQ(sim_->apply_geological_preset("martian").code(), core::ErrorCode::UnknownPreset);
    EXPECT_TRUE(sim_->quick_config_water("wet"));
    EXPECT_TRUE(sim_->get_world().get_terrain_at(15, 15).discovered) << "Surroundings revealed again";
}

// Test: Configuration updates reach the world
TEST_F(SimulationTest, ConfigurationUpdateReachesWorld) {
    ASSERT_TRUE(sim_->update_configuration(core::config_section::TERRAIN_TYPES,
                                           {{"river", {{"symbol", "≈"},
                                                       {"style_tag", "terrain-water"},
                                                       {"name", "River"},
                                                       {"walkable", false}}}}));
    EXPECT_EQ(sim_->render_cell(16, 0).symbol, "≈");
    EXPECT_FALSE(sim_->update_configuration(core::config_section::CLASSIFIER, {{"hysteresis", -1.0}}));
}

// Test: Deer and companion settings reach the running agents
TEST_F(SimulationTest, AgentSettingsApplyToRunningAgents) {
    ASSERT_GT(sim_->get_deer_manager().get_deer_count(), 0u);

    ASSERT_TRUE(sim_->update_configuration(core::config_section::DEER, {{"vision_range", 6}, {"alert_range", 3}}));
    EXPECT_EQ(sim_->get_deer_manager().get_config().alert_range, 3);
    for (const auto& deer : sim_->get_deer_manager().get_deer()) {
        EXPECT_EQ(deer.get_vision_range(), 6);
    }

    ASSERT_TRUE(sim_->update_configuration(core::config_section::COMPANION, {{"follow_distance", 4}}));
    EXPECT_EQ(sim_->get_companion_manager().get_config().follow_distance, 4);
}

// Test: A new tick interval takes effect from the moment of the update
TEST_F(SimulationTest, TickIntervalUpdateReschedules) {
    ASSERT_TRUE(sim_->toggle_deer_debug());
    ASSERT_TRUE(sim_->update_configuration(core::config_section::PERFORMANCE,
                                           {{core::config_key::DEER_UPDATE_INTERVAL_MS, 300}}));
    EXPECT_TRUE(sim_->get_deer_manager().is_attached());
    EXPECT_EQ(sim_->get_deer_manager().get_config().update_interval_ms, 300u);
    EXPECT_TRUE(sim_->get_deer_manager().is_debug_mode()) << "Runtime toggle kept";

    clock_.advance(300);
    EXPECT_EQ(sim_->update(), 2u) << "companion at 200, deer at 300";
}

// Test: Agent settings the agents cannot run with are refused and rolled back
TEST_F(SimulationTest, InvalidAgentSettingsRollBack) {
    const nlohmann::json before = config_.section(core::config_section::DEER);

    auto status = sim_->update_configuration(core::config_section::DEER, {{"alert_confirm_ticks", 0}, {"extra", 1}});
    EXPECT_EQ(status.code(), core::ErrorCode::ConfigurationInvalid);
    EXPECT_EQ(config_.section(core::config_section::DEER), before);

    status = sim_->update_configuration(core::config_section::DEER, {{"alert_range", "near"}});
    EXPECT_EQ(status.code(), core::ErrorCode::ConfigurationInvalid);
    EXPECT_EQ(config_.section(core::config_section::DEER), before);
    EXPECT_EQ(sim_->get_deer_manager().get_config().alert_confirm_ticks, 2);

    EXPECT_FALSE(sim_->update_configuration(core::config_section::COMPANION, {{"idle_timeout_ticks", 0}}));
    EXPECT_EQ(sim_->get_companion_manager().get_config().idle_timeout_ticks, 20);
}

// Test: Exported state includes the configuration
TEST_F(SimulationTest, ExportIncludesConfiguration) {
    nlohmann::json state = sim_->export_world_state();
    EXPECT_EQ(state["configuration"]["world"]["modules"], nlohmann::json::array({"painted"}));
    EXPECT_FALSE(state["generatedCells"].empty());
}

// Test: Agents standing on terrain made unwalkable are moved to tiles they may occupy
TEST(SimulationRelocationTest, TerrainTypeUpdateMovesAgents) {
    core::Config config;
    core::ManualClock clock;
    test::use_painted_world(config, world::WorldBounds{-30, 30, -30, 30});
    Simulation sim(config, clock, test::painted_registry(test::plains_except([](int32_t x, int32_t) {
                       return x == 14 ? std::optional<TerrainKind>(TerrainKind::Forest) : std::nullopt;
                   })));
    ASSERT_TRUE(sim.initialize());
    ASSERT_EQ(sim.get_player()->get_position(), Position(15, 15));

    ASSERT_TRUE(sim.update_configuration(core::config_section::TERRAIN_TYPES,
                                         {{"plains", {{"symbol", "▓"},
                                                      {"style_tag", "terrain-grass"},
                                                      {"name", "Plains"},
                                                      {"walkable", false}}}}));

    const entity::Player* player = sim.get_player();
    EXPECT_EQ(player->get_position(), Position(14, 14));
    EXPECT_TRUE(sim.get_world().can_move_to(player->get_x(), player->get_y()));
    EXPECT_TRUE(player->can_move_to(player->get_x(), player->get_y()));

    for (const auto& deer : sim.get_deer_manager().get_deer()) {
        EXPECT_EQ(deer.get_x(), 14);
        EXPECT_TRUE(deer.can_move_to(deer.get_x(), deer.get_y()));
    }

    // Nothing within two tiles of the companion is forest, so it joins the player
    const agents::Companion* dog = sim.get_companion_manager().get_companion();
    ASSERT_NE(dog, nullptr);
    EXPECT_EQ(dog->get_position(), Position(14, 14));
}

// Test: With nowhere left to stand the companion is removed rather than stranded
TEST(SimulationRelocationTest, CompanionRemovedWhenNothingIsWalkable) {
    core::Config config;
    core::ManualClock clock;
    test::use_painted_world(config, world::WorldBounds{-30, 30, -30, 30});
    Simulation sim(config, clock, test::painted_registry(test::plains_except([](int32_t, int32_t) {
                       return std::optional<TerrainKind>{};
                   })));
    ASSERT_TRUE(sim.initialize());

    ASSERT_TRUE(sim.update_configuration(core::config_section::TERRAIN_TYPES,
                                         {{"plains", {{"symbol", "▓"},
                                                      {"style_tag", "terrain-grass"},
                                                      {"name", "Plains"},
                                                      {"walkable", false}}}}));
    EXPECT_FALSE(sim.get_companion_manager().has_companion());
    EXPECT_EQ(sim.get_deer_manager().get_deer_count(), 0u);
}

// Test: The nearest passable tile is found ring by ring
TEST(FindNearestPassableTest, SearchesRings) {
    core::Config config;
    test::use_painted_world(config, world::WorldBounds{-10, 10, -10, 10});
    world::World world(config, test::painted_registry(test::plains_except([](int32_t x, int32_t y) {
                           return x >= 0 && x <= 2 && y >= 0 && y <= 2 ? std::optional<TerrainKind>(TerrainKind::Lake)
                                                                       : std::nullopt;
                       })));
    ASSERT_TRUE(world.initialize());

    auto spot = find_nearest_passable(world, Position{1, 1}, 5);
    ASSERT_TRUE(spot.has_value());
    EXPECT_EQ(world::chebyshev_distance(*spot, Position{1, 1}), 2);

    EXPECT_FALSE(find_nearest_passable(world, Position{1, 1}, 1).has_value());
    EXPECT_EQ(find_nearest_passable(world, Position{5, 5}, 0), std::optional<Position>(Position{5, 5}));
}

// Test: Footing search respects the walker's own rules
TEST(FindNearestFootingTest, FollowsEntityRules) {
    core::Config config;
    test::use_painted_world(config, world::WorldBounds{-10, 10, -10, 10});
    world::World world(config, test::painted_registry(test::plains_except([](int32_t x, int32_t) {
                           return x <= 1 ? std::optional<TerrainKind>(TerrainKind::Mountain) : std::nullopt;
                       })));
    ASSERT_TRUE(world.initialize());

    entity::Player player(world, Position{0, 0});
    entity::MovableEntity walker(world, Position{0, 0});
    EXPECT_EQ(find_nearest_footing(player, Position{0, 0}, 3), std::optional<Position>(Position{0, 0}));

    auto spot = find_nearest_footing(walker, Position{0, 0}, 3);
    ASSERT_TRUE(spot.has_value());
    EXPECT_EQ(spot->x, 2);
    EXPECT_EQ(world::chebyshev_distance(*spot, Position{0, 0}), 2);
}

}  // namespace
}  // namespace tileworld::sim
