// TileWorld World System Tests
// geology_module_test.cpp - Tests for formations and rock lattices

#include <gtest/gtest.h>

#include <algorithm>
#include <tileworld/world/geology_module.hpp>

namespace tileworld::world {
namespace {

class GeologyModuleTest : public ::testing::Test {
protected:
    static constexpr WorldBounds BOUNDS{-50, 50, -50, 50};
};

// Test: Each template contributes its configured number of formations
TEST_F(GeologyModuleTest, FormationCountMatchesTemplates) {
    GeologyModule module;
    module.generate(WorldContext(BOUNDS, 42));

    ASSERT_TRUE(module.is_generated());
    // 2 granite + 3 limestone + 4 clay
    EXPECT_EQ(module.get_formations().size(), 9u);

    for (size_t i = 0; i < module.get_formations().size(); ++i) {
        const auto& formation = module.get_formations()[i];
        EXPECT_EQ(formation.id, i) << "Ids are global across templates";
        EXPECT_GE(formation.strength, 0.8f);
        EXPECT_LE(formation.strength, 1.2f);
        EXPECT_GT(formation.radius, 0.0f);
        EXPECT_TRUE(BOUNDS.contains(formation.center_x, formation.center_y));
    }
}

// Test: Same seed produces the same formations and rock
TEST_F(GeologyModuleTest, DeterministicForSameSeed) {
    GeologyModule a;
    GeologyModule b;
    a.generate(WorldContext(BOUNDS, 12345));
    b.generate(WorldContext(BOUNDS, 12345));

    EXPECT_EQ(a.get_formations(), b.get_formations());
    for (int x = BOUNDS.min_x; x <= BOUNDS.max_x; x += 3) {
        for (int y = BOUNDS.min_y; y <= BOUNDS.max_y; y += 3) {
            EXPECT_EQ(a.get_rock_type_at(x, y), b.get_rock_type_at(x, y)) << "at (" << x << ", " << y << ")";
            EXPECT_FLOAT_EQ(a.get_soil_quality_at(x, y), b.get_soil_quality_at(x, y));
        }
    }
}

// Test: A different seed moves the formation centres
TEST_F(GeologyModuleTest, DifferentSeedsMoveFormations) {
    GeologyModule a;
    GeologyModule b;
    a.generate(WorldContext(BOUNDS, 1));
    b.generate(WorldContext(BOUNDS, 2));
    EXPECT_NE(a.get_formations(), b.get_formations());
}

// Test: Lattice lookups agree with direct evaluation
TEST_F(GeologyModuleTest, LatticeLookupMatchesDirectEvaluation) {
    GeologyModule module;
    module.generate(WorldContext(BOUNDS, 7));

    // Lattice points hold exactly what direct evaluation produces
    for (int x = BOUNDS.min_x; x <= BOUNDS.max_x; x += GeologyModule::LATTICE_STRIDE * 5) {
        for (int y = BOUNDS.min_y; y <= BOUNDS.max_y; y += GeologyModule::LATTICE_STRIDE * 5) {
            EXPECT_EQ(module.get_rock_type_at(x, y), module.determine_rock_type_at(x, y));
        }
    }
}

// Test: Off-lattice coordinates use the nearest lattice sample
TEST_F(GeologyModuleTest, OffLatticeSnapsToNeighbour) {
    GeologyModule module;
    module.generate(WorldContext(BOUNDS, 7));

    // -49 is between lattice points -50 and -48
    RockType rock = module.get_rock_type_at(-49, -50);
    EXPECT_TRUE(rock == module.get_rock_type_at(-50, -50) || rock == module.get_rock_type_at(-48, -50));
}

// Test: Coordinates outside the world bounds get the base rock
TEST_F(GeologyModuleTest, OutsideBoundsUsesBaseRock) {
    GeologyConfig config;
    config.base_rock_type = RockType::Clay;
    GeologyModule module(config);
    module.generate(WorldContext(BOUNDS, 7));

    EXPECT_EQ(module.get_rock_type_at(500, 500), RockType::Clay);
    EXPECT_FLOAT_EQ(module.get_soil_quality_at(500, 500), config.properties(RockType::Clay).soil_quality);
}

// Test: Soil quality stays within [0, 1]
TEST_F(GeologyModuleTest, SoilQualityInRange) {
    GeologyModule module;
    module.generate(WorldContext(BOUNDS, 99));
    for (int x = BOUNDS.min_x; x <= BOUNDS.max_x; x += 5) {
        for (int y = BOUNDS.min_y; y <= BOUNDS.max_y; y += 5) {
            float soil = module.get_soil_quality_at(x, y);
            EXPECT_GE(soil, 0.0f);
            EXPECT_LE(soil, 1.0f);
        }
    }
}

// Test: Elevation influence at a formation centre matches the rock bonus formula
TEST_F(GeologyModuleTest, ElevationInfluenceFollowsFormula) {
    GeologyConfig config;
    config.formations = {FormationTemplate{"granite", 1, 20.0f, 20.0f, RockType::Hard, 0.5f}};
    config.perturbation_noise_threshold = 2.0f;  // No outcrops
    GeologyModule module(config);
    module.generate(WorldContext(BOUNDS, 3));

    const auto& formation = module.get_formations().front();
    const int cx = formation.center_x;
    const int cy = formation.center_y;

    // At the center: hard rock bonus + 0.3 * 1 * effect * strength
    float expected = config.properties(RockType::Hard).elevation_bonus + 0.3f * 0.5f * formation.strength;
    EXPECT_EQ(module.get_rock_type_at(cx, cy), RockType::Hard);
    EXPECT_NEAR(module.get_elevation_influence_at(cx, cy), expected, 1e-5f);
    EXPECT_EQ(module.get_formations_at(cx, cy).size(), 1u);
}

// Test: No elevation influence beyond a formation radius
TEST_F(GeologyModuleTest, InfluenceIsZeroOutsideFormation) {
    GeologicalFormation formation;
    formation.center_x = 0;
    formation.center_y = 0;
    formation.radius = 10.0f;
    formation.strength = 1.0f;

    EXPECT_FLOAT_EQ(formation.influence_at(0, 0), 1.0f);
    EXPECT_NEAR(formation.influence_at(5, 0), 0.5f, 1e-6f);
    EXPECT_FLOAT_EQ(formation.influence_at(20, 0), 0.0f);
    EXPECT_FALSE(formation.contains(11, 0));
}

// Test: Malformed formation templates are rejected
TEST_F(GeologyModuleTest, InvalidTemplatesThrow) {
    GeologyConfig config;
    config.formations = {FormationTemplate{"broken", 1, 30.0f, 10.0f, RockType::Hard, 0.5f}};
    GeologyModule module(config);
    EXPECT_THROW(module.generate(WorldContext(BOUNDS, 1)), ConfigurationError);
    EXPECT_FALSE(module.is_generated());
}

// Test: Samples carry rock type and soil quality
TEST_F(GeologyModuleTest, SampleDescribesRock) {
    GeologyModule module;
    WorldContext context(BOUNDS, 5);
    module.generate(context);

    ModuleSample sample = module.get_data_at(0, 0, context);
    EXPECT_FALSE(sample.terrain.has_value());
    ASSERT_FALSE(sample.features.empty());
    EXPECT_EQ(sample.features[0].rfind("rock-", 0), 0u);
    EXPECT_TRUE(sample.values.count("elevation_influence"));
}

// Test: Statistics count formations and every lattice sample
TEST_F(GeologyModuleTest, StatsCountLattice) {
    GeologyModule module;
    module.generate(WorldContext(BOUNDS, 5));
    auto stats = module.get_stats();
    EXPECT_EQ(stats.formation_count, module.get_formations().size());
    EXPECT_EQ(stats.lattice_samples, 51u * 51u);

    size_t total = 0;
    for (size_t count : stats.rock_counts) {
        total += count;
    }
    EXPECT_EQ(total, stats.lattice_samples);
}

}  // namespace
}  // namespace tileworld::world
