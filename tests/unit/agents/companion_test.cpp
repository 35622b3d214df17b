// TileWorld Agents Tests
// companion_test.cpp - Tests for the companion dog

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <tileworld/agents/companion_manager.hpp>
#include <tileworld/core/clock.hpp>
#include <tileworld/core/tick_scheduler.hpp>
#include <tileworld/world/world.hpp>

#include "painted_terrain.hpp"

namespace tileworld::agents {
namespace {

using world::Position;
using world::TerrainKind;

class CompanionTest : public ::testing::Test {
protected:
    void SetUp() override { build([](int32_t, int32_t) { return std::optional<TerrainKind>{}; }); }

    void build(test::PaintFn paint, bool trees = false) {
        test::use_painted_world(config_, world::WorldBounds{-30, 30, -30, 30});
        config_.set_bool(core::config_section::TREES, "enabled", trees);
        world_ = std::make_unique<world::World>(config_, test::painted_registry(test::plains_except(std::move(paint))));
        ASSERT_TRUE(world_->initialize());
    }

    core::Config config_;
    std::unique_ptr<world::World> world_;
};

TEST_F(CompanionTest, CatchesUpWithPlayer) {
    CompanionManager manager(*world_, load_companion_config(config_));
    ASSERT_TRUE(manager.spawn());
    ASSERT_EQ(manager.get_companion()->get_position(), Position(17, 17));
    EXPECT_EQ(manager.get_companion()->get_state(), CompanionState::Following);

    Position player{20, 15};
    manager.set_player_locator([&player]() { return std::optional<Position>(player); });

    const auto ticks = static_cast<uint64_t>(std::ceil(world::euclidean_distance(Position{17, 17}, player)));
    for (uint64_t tick = 1; tick <= ticks; ++tick) {
        manager.update(tick);
    }
    EXPECT_LE(world::chebyshev_distance(manager.get_companion()->get_position(), player), 2);
}

TEST_F(CompanionTest, StaysPutWithinFollowDistance) {
    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn());
    manager.set_player_locator([]() { return std::optional<Position>(Position{15, 15}); });

    manager.update(1);
    EXPECT_EQ(manager.get_companion()->get_position(), Position(17, 17));
}

TEST_F(CompanionTest, IdlesWhenPlayerStationary) {
    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn());
    Position player{15, 15};
    manager.set_player_locator([&player]() { return std::optional<Position>(player); });

    for (uint64_t tick = 1; tick < 20; ++tick) {
        manager.update(tick);
        ASSERT_EQ(manager.get_companion()->get_state(), CompanionState::Following) << "tick " << tick;
    }
    manager.update(20);
    EXPECT_EQ(manager.get_companion()->get_state(), CompanionState::Idle);
    EXPECT_EQ(manager.get_companion()->get_stationary_ticks(), 20);

    player = Position{10, 15};
    manager.update(21);
    EXPECT_EQ(manager.get_companion()->get_state(), CompanionState::Following);
    EXPECT_EQ(manager.get_companion()->get_stationary_ticks(), 0);
    EXPECT_EQ(manager.get_companion()->get_position(), Position(16, 16)) << "Moved toward the player";
}

TEST_F(CompanionTest, ComeOverridesIdle) {
    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn());
    manager.set_player_locator([]() { return std::optional<Position>(Position{10, 10}); });

    for (uint64_t tick = 1; tick <= 25; ++tick) {
        manager.update(tick);
    }
    ASSERT_EQ(manager.get_companion()->get_state(), CompanionState::Idle);

    ASSERT_TRUE(manager.call_companion());
    EXPECT_EQ(manager.get_companion()->get_state(), CompanionState::Coming);

    uint64_t tick = 26;
    while (manager.get_companion()->get_state() == CompanionState::Coming && tick < 60) {
        manager.update(tick++);
    }
    EXPECT_EQ(manager.get_companion()->get_state(), CompanionState::Following);
    EXPECT_LE(world::chebyshev_distance(manager.get_companion()->get_position(), Position{10, 10}), 2);
}

TEST_F(CompanionTest, CallWithoutCompanion) {
    CompanionManager manager(*world_);
    EXPECT_FALSE(manager.call_companion());
    manager.update(1);
    EXPECT_FALSE(manager.has_companion());
}

TEST_F(CompanionTest, StepPrefersDiagonalThenAxes) {
    // River column blocks the diagonal and the x step
    build([](int32_t x, int32_t) { return x == 1 ? std::optional<TerrainKind>(TerrainKind::River) : std::nullopt; });

    Companion companion(*world_, Position{0, 0}, CompanionConfig{});
    EXPECT_TRUE(companion.step_toward(Position{5, 2}));
    EXPECT_EQ(companion.get_position(), Position(0, 1));

    Companion open_field(*world_, Position{-10, 0}, CompanionConfig{});
    EXPECT_TRUE(open_field.step_toward(Position{-5, 2}));
    EXPECT_EQ(open_field.get_position(), Position(-9, 1));

    EXPECT_FALSE(open_field.step_toward(open_field.get_position()));
}

TEST_F(CompanionTest, SpawnSearchesNearby) {
    build([](int32_t x, int32_t y) {
        return x == 17 && y == 17 ? std::optional<TerrainKind>(TerrainKind::Lake) : std::nullopt;
    });
    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn());
    Position pos = manager.get_companion()->get_position();
    EXPECT_NE(pos, Position(17, 17));
    EXPECT_EQ(world::chebyshev_distance(pos, Position{17, 17}), 1);
}

// Test: Walkable terrain the companion's rules forbid is skipped at spawn
TEST_F(CompanionTest, SpawnSkipsForbiddenTerrain) {
    build([](int32_t x, int32_t y) {
        return x == 17 && y == 17 ? std::optional<TerrainKind>(TerrainKind::Mountain) : std::nullopt;
    });
    ASSERT_TRUE(world_->can_move_to(17, 17));

    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn());
    EXPECT_EQ(manager.get_companion()->get_position(), Position(16, 16));
}

TEST_F(CompanionTest, SpawnFailsWhenSurrounded) {
    build([](int32_t x, int32_t y) {
        return std::abs(x - 17) <= 2 && std::abs(y - 17) <= 2 ? std::optional<TerrainKind>(TerrainKind::Lake)
                                                              : std::nullopt;
    });
    CompanionManager manager(*world_);
    EXPECT_FALSE(manager.spawn());
    EXPECT_FALSE(manager.has_companion());
}

TEST_F(CompanionTest, RenderOverlay) {
    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn());

    world::RenderedCell base = world_->render_cell(17, 17);
    world::RenderedCell rendered = manager.render(Position{17, 17}, base);
    EXPECT_EQ(rendered.symbol, "♥");
    EXPECT_EQ(rendered.display_name, "Companion");
    EXPECT_EQ(rendered.style_tag, "companion-dog companion-following");
    EXPECT_TRUE(rendered.companion);

    EXPECT_EQ(manager.render(Position{0, 0}, world_->render_cell(0, 0)), world_->render_cell(0, 0));
}

TEST_F(CompanionTest, CanopyHidesCompanion) {
    build([](int32_t, int32_t) { return std::optional<TerrainKind>{}; }, true);
    ASSERT_GT(world_->get_trees().get_tree_count(), 0u);
    Position trunk = world_->get_trees().get_trees().front().trunk;
    Position canopy{trunk.x, trunk.y + 1};

    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn_near(canopy));
    ASSERT_EQ(manager.get_companion()->get_position(), canopy);

    world::RenderedCell base = world_->render_cell(canopy.x, canopy.y);
    EXPECT_EQ(manager.render(canopy, base), base);
}

TEST_F(CompanionTest, TicksFromScheduler) {
    core::ManualClock clock;
    core::TickScheduler scheduler(clock);
    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn());
    manager.set_player_locator([]() { return std::optional<Position>(Position{25, 17}); });
    ASSERT_TRUE(manager.attach(scheduler));

    clock.advance(1000);
    EXPECT_EQ(scheduler.run_due(), 5u);
    EXPECT_EQ(manager.get_companion()->get_last_decision_tick(), 5u);
    EXPECT_LE(world::chebyshev_distance(manager.get_companion()->get_position(), Position{25, 17}), 3);

    manager.despawn();
    EXPECT_FALSE(manager.has_companion());
}

TEST(CompanionStateTest, Names) {
    EXPECT_STREQ(companion_state_to_string(CompanionState::Coming), "coming");
    EXPECT_EQ(companion_state_from_string("idle"), CompanionState::Idle);
    EXPECT_FALSE(companion_state_from_string("sleeping").has_value());
}

// Test: A new tick interval re-registers the companion ticker
TEST_F(CompanionTest, IntervalChangeReregistersTicker) {
    core::ManualClock clock;
    core::TickScheduler scheduler(clock);
    CompanionManager manager(*world_);
    ASSERT_TRUE(manager.spawn());
    ASSERT_TRUE(manager.attach(scheduler));

    CompanionConfig config = manager.get_config();
    config.update_interval_ms = 500;
    config.follow_distance = 3;
    manager.set_config(config);
    EXPECT_EQ(scheduler.get_active_count(), 1u);

    clock.advance(499);
    EXPECT_EQ(scheduler.run_due(), 0u);
    clock.advance(1);
    EXPECT_EQ(scheduler.run_due(), 1u);
}

TEST(CompanionConfigTest, Validation) {
    EXPECT_TRUE(validate_companion_config(CompanionConfig{}));

    CompanionConfig config;
    config.idle_timeout_ticks = 0;
    EXPECT_EQ(validate_companion_config(config).code(), core::ErrorCode::ConfigurationInvalid);

    config = CompanionConfig{};
    config.follow_distance = -1;
    EXPECT_FALSE(validate_companion_config(config));
}

}  // namespace
}  // namespace tileworld::agents
