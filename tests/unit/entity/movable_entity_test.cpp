// TileWorld Entity System Tests
// movable_entity_test.cpp - Tests for rule-checked movement

#include <gtest/gtest.h>

#include <memory>
#include <tileworld/entity/movable_entity.hpp>
#include <tileworld/world/world.hpp>

#include "painted_terrain.hpp"

namespace tileworld::entity {
namespace {

using world::Position;
using world::TerrainKind;

class MovableEntityTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::use_painted_world(config_, world::WorldBounds{-20, 20, -20, 20});
        world_ = std::make_unique<world::World>(
            config_, test::painted_registry(test::plains_except([](int32_t x, int32_t y) -> std::optional<TerrainKind> {
                if (x == 16) {
                    return TerrainKind::River;
                }
                if (x == 14) {
                    return TerrainKind::Mountain;
                }
                if (y == 17) {
                    return TerrainKind::Building;
                }
                return std::nullopt;
            })));
        ASSERT_TRUE(world_->initialize());
    }

    core::Config config_;
    std::unique_ptr<world::World> world_;
};

// Test: Rivers stop the player and explain why
TEST_F(MovableEntityTest, PlayerBlockedByRiver) {
    Player player(*world_);
    ASSERT_EQ(player.get_position(), Position(15, 15));

    std::string message;
    player.set_blocked_handler(
        [&message](const MovableEntity&, const Position&, const std::string& reason) { message = reason; });

    EXPECT_FALSE(player.move(1, 0));
    EXPECT_EQ(player.get_position(), Position(15, 15));
    EXPECT_NE(message.find("River"), std::string::npos);
    EXPECT_EQ(player.get_last_block_reason(), message);
}

// Test: A successful move clears the last refusal
TEST_F(MovableEntityTest, SuccessfulMoveClearsReason) {
    Player player(*world_);
    EXPECT_FALSE(player.move(1, 0));
    EXPECT_TRUE(player.move(0, -1));
    EXPECT_EQ(player.get_position(), Position(15, 14));
    EXPECT_TRUE(player.get_last_block_reason().empty());
}

// Test: The player may climb mountains; other walkers may not
TEST_F(MovableEntityTest, PlayerClimbsMountainsWildlifeDoesNot) {
    Player player(*world_);
    EXPECT_TRUE(player.can_move_to(14, 15));

    MovableEntity deer(*world_, Position{15, 15});
    EXPECT_FALSE(deer.can_move_to(14, 15));
    EXPECT_EQ(deer.get_block_reason(14, 15), std::optional<std::string>("Cannot walk on Mountain"));
}

// Test: A forbidden kind stays forbidden even when allowed
TEST_F(MovableEntityTest, ForbiddenWinsOverAllowed) {
    MovementRules rules;
    rules.can_walk_on = {TerrainKind::Plains, TerrainKind::Mountain};
    rules.cannot_walk_on = {TerrainKind::Mountain};

    MovableEntity entity(*world_, Position{15, 10}, rules);
    EXPECT_FALSE(entity.move(-1, 0));
    EXPECT_EQ(entity.get_position(), Position(15, 10));
    EXPECT_TRUE(entity.move(0, 1));
}

// Test: Moves past the world edge are refused
TEST_F(MovableEntityTest, BoundaryRefused) {
    MovableEntity entity(*world_, Position{20, 0});
    EXPECT_FALSE(entity.move(1, 0));
    EXPECT_EQ(entity.get_last_block_reason(), "Cannot move outside world boundaries");
    EXPECT_EQ(entity.get_position(), Position(20, 0));
}

// Test: Kinds missing from the allowed list are refused
TEST_F(MovableEntityTest, UnlistedKindRefused) {
    MovementRules rules;
    rules.can_walk_on = {TerrainKind::Plains};

    MovableEntity entity(*world_, Position{0, 16}, rules);
    EXPECT_FALSE(entity.can_move_to(0, 17));
    EXPECT_TRUE(entity.can_move_to(0, 15));
}

// Test: Special terrain needs the matching access tag
TEST_F(MovableEntityTest, SpecialAccessNeedsTag) {
    MovementRules rules;
    rules.can_walk_on = {TerrainKind::Plains};
    rules.special_access = {{TerrainKind::Building, "door"}};

    MovableEntity entity(*world_, Position{0, 16}, rules);
    EXPECT_FALSE(entity.can_move_to(0, 17));

    entity.grant_access("door");
    EXPECT_TRUE(entity.has_access("door"));
    EXPECT_TRUE(entity.move(0, 1));
    EXPECT_EQ(entity.get_position(), Position(0, 17));

    entity.revoke_access("door");
    EXPECT_FALSE(entity.can_move_to(1, 17));
}

// Test: A door tag does not open buildings the default rules forbid
TEST_F(MovableEntityTest, DefaultRulesIgnoreDoorForBuildings) {
    MovableEntity entity(*world_, Position{0, 16});
    entity.grant_access("door");
    EXPECT_FALSE(entity.can_move_to(0, 17)) << "cannot_walk_on outranks special access";
}

// Test: Movement rules never allow what the world forbids
TEST_F(MovableEntityTest, RulesNeverWidenWorldWalkability) {
    MovementRules rules;
    rules.can_walk_on = {TerrainKind::Plains, TerrainKind::River};

    MovableEntity swimmer(*world_, Position{15, 0}, rules);
    EXPECT_FALSE(swimmer.can_move_to(16, 0));
}

class TrunkTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::use_painted_world(config_, world::WorldBounds{-30, 30, -30, 30});
        config_.set_bool(core::config_section::TREES, "enabled", true);
        world_ = std::make_unique<world::World>(
            config_, test::painted_registry(test::plains_except([](int32_t, int32_t) {
                return std::optional<TerrainKind>{};
            })));
        ASSERT_TRUE(world_->initialize());
        ASSERT_GT(world_->get_trees().get_tree_count(), 0u);
    }

    core::Config config_;
    std::unique_ptr<world::World> world_;
};

// Test: Trunks block movement; canopy does not
TEST_F(TrunkTest, TrunkBlocksCanopyDoesNot) {
    Position trunk = world_->get_trees().get_trees().front().trunk;
    MovableEntity entity(*world_, Position{trunk.x - 1, trunk.y});

    EXPECT_FALSE(entity.can_move_to(trunk.x, trunk.y));
    EXPECT_EQ(entity.get_block_reason(trunk.x, trunk.y), std::optional<std::string>("Cannot walk through a tree trunk"));
    EXPECT_TRUE(entity.can_move_to(trunk.x - 1, trunk.y + 1));
}

}  // namespace
}  // namespace tileworld::entity
