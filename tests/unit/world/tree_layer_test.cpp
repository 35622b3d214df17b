// TileWorld World System Tests
// tree_layer_test.cpp - Tests for tree placement

#include <gtest/gtest.h>

#include <tileworld/world/tree_layer.hpp>

namespace tileworld::world {
namespace {

class TreeLayerTest : public ::testing::Test {
protected:
    static constexpr WorldBounds BOUNDS{-40, 40, -40, 40};

    static TerrainKind all_plains(int32_t, int32_t) { return TerrainKind::Plains; }

    TreeLayer layer_;
    TreeConfig config_;
};

// Test: Trees are placed on open plains
TEST_F(TreeLayerTest, PlacesTreesOnPlains) {
    layer_.generate(BOUNDS, 42, config_, all_plains);
    EXPECT_GT(layer_.get_tree_count(), 0u);
    EXPECT_LE(layer_.get_tree_count(), static_cast<size_t>(config_.max_trees));
}

// Test: A tree is a trunk surrounded by eight canopy cells
TEST_F(TreeLayerTest, FootprintIsTrunkWithCanopy) {
    layer_.generate(BOUNDS, 42, config_, all_plains);
    ASSERT_FALSE(layer_.get_trees().empty());

    for (const auto& tree : layer_.get_trees()) {
        auto trunk = layer_.get_feature_at(tree.trunk.x, tree.trunk.y);
        ASSERT_TRUE(trunk.has_value());
        EXPECT_EQ(trunk->type, FeatureType::TreeTrunk);
        EXPECT_EQ(trunk->tree_id, tree.id);
        EXPECT_TRUE(layer_.has_trunk_at(tree.trunk.x, tree.trunk.y));

        for (int32_t dy = -1; dy <= 1; ++dy) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                auto feature = layer_.get_feature_at(tree.trunk.x + dx, tree.trunk.y + dy);
                ASSERT_TRUE(feature.has_value());
                EXPECT_TRUE(blocks_sight(*feature));
            }
        }
    }
}

// Test: Trunks keep their spacing and distance from the edge
TEST_F(TreeLayerTest, TrunksRespectSpacingAndMargin) {
    layer_.generate(BOUNDS, 7, config_, all_plains);
    const auto& trees = layer_.get_trees();
    for (size_t i = 0; i < trees.size(); ++i) {
        EXPECT_GE(trees[i].trunk.x, BOUNDS.min_x + config_.boundary_margin + 1);
        EXPECT_LE(trees[i].trunk.x, BOUNDS.max_x - config_.boundary_margin - 1);
        EXPECT_GE(trees[i].trunk.y, BOUNDS.min_y + config_.boundary_margin + 1);
        EXPECT_LE(trees[i].trunk.y, BOUNDS.max_y - config_.boundary_margin - 1);
        for (size_t j = i + 1; j < trees.size(); ++j) {
            EXPECT_GE(euclidean_distance(trees[i].trunk, trees[j].trunk), config_.min_tree_spacing);
        }
    }
}

// Test: Placement stops at the configured maximum
TEST_F(TreeLayerTest, MaxTreesCaps) {
    config_.max_trees = 3;
    layer_.generate(BOUNDS, 42, config_, all_plains);
    EXPECT_LE(layer_.get_tree_count(), 3u);
}

// Test: Trees need plains under their whole footprint
TEST_F(TreeLayerTest, WholeFootprintMustBePlains) {
    // Forest on every odd column leaves no 3x3 plains block
    auto striped = [](int32_t x, int32_t) { return (x & 1) != 0 ? TerrainKind::Forest : TerrainKind::Plains; };
    layer_.generate(BOUNDS, 42, config_, striped);
    EXPECT_EQ(layer_.get_tree_count(), 0u);

    auto half = [](int32_t x, int32_t) { return x < 0 ? TerrainKind::River : TerrainKind::Plains; };
    layer_.generate(BOUNDS, 42, config_, half);
    for (const auto& tree : layer_.get_trees()) {
        EXPECT_GE(tree.trunk.x - 1, 0);
    }
}

// Test: Disabled trees place nothing
TEST_F(TreeLayerTest, DisabledPlacesNothing) {
    config_.enabled = false;
    layer_.generate(BOUNDS, 42, config_, all_plains);
    EXPECT_EQ(layer_.get_tree_count(), 0u);
    EXPECT_FALSE(layer_.get_feature_at(0, 0).has_value());
}

// Test: Same seed places the same trees
TEST_F(TreeLayerTest, DeterministicForSeed) {
    TreeLayer other;
    layer_.generate(BOUNDS, 99, config_, all_plains);
    other.generate(BOUNDS, 99, config_, all_plains);
    ASSERT_EQ(layer_.get_tree_count(), other.get_tree_count());
    for (size_t i = 0; i < layer_.get_tree_count(); ++i) {
        EXPECT_EQ(layer_.get_trees()[i].trunk, other.get_trees()[i].trunk);
    }
}

// Test: Clearing removes every trunk and canopy cell
TEST_F(TreeLayerTest, ClearRemovesFeatures) {
    layer_.generate(BOUNDS, 42, config_, all_plains);
    ASSERT_FALSE(layer_.get_trees().empty());
    Position trunk = layer_.get_trees().front().trunk;
    layer_.clear();
    EXPECT_EQ(layer_.get_tree_count(), 0u);
    EXPECT_FALSE(layer_.has_trunk_at(trunk.x, trunk.y));
}

// Test: A world too small for a footprint gets no trees
TEST_F(TreeLayerTest, TinyWorldHasNoTrees) {
    layer_.generate(WorldBounds{0, 4, 0, 4}, 42, config_, all_plains);
    EXPECT_EQ(layer_.get_tree_count(), 0u);
}

}  // namespace
}  // namespace tileworld::world
