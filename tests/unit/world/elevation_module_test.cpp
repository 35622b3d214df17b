// TileWorld World System Tests
// elevation_module_test.cpp - Tests for the elevation field

#include <gtest/gtest.h>

#include <tileworld/world/elevation_module.hpp>
#include <tileworld/world/geology_module.hpp>

namespace tileworld::world {
namespace {

class ElevationModuleTest : public ::testing::Test {
protected:
    static constexpr WorldBounds BOUNDS{-40, 40, -40, 40};

    void SetUp() override {
        context_ = WorldContext(BOUNDS, 42);
        geology_.generate(context_);
        context_.bind_module(GeologyModule::NAME, &geology_);
    }

    WorldContext context_;
    GeologyModule geology_;
};

TEST_F(ElevationModuleTest, DependsOnGeologyOnlyWhenUsingIt) {
    EXPECT_EQ(ElevationModule().get_dependencies(), std::vector<std::string>{"geology"});

    ElevationConfig config;
    config.use_geology = false;
    EXPECT_TRUE(ElevationModule(config).get_dependencies().empty());
}

TEST_F(ElevationModuleTest, ValuesStayInUnitRange) {
    ElevationModule module;
    module.generate(context_);
    ASSERT_TRUE(module.is_generated());
    EXPECT_TRUE(module.is_using_geology());

    for (int x = BOUNDS.min_x; x <= BOUNDS.max_x; x += 2) {
        for (int y = BOUNDS.min_y; y <= BOUNDS.max_y; y += 2) {
            float elevation = module.get_elevation_at(x, y);
            EXPECT_GE(elevation, 0.0f);
            EXPECT_LE(elevation, 1.0f);
        }
    }
}

TEST_F(ElevationModuleTest, DeterministicAcrossInstances) {
    ElevationModule a;
    ElevationModule b;
    a.generate(context_);
    b.generate(context_);

    for (int x = BOUNDS.min_x; x <= BOUNDS.max_x; x += 3) {
        for (int y = BOUNDS.min_y; y <= BOUNDS.max_y; y += 3) {
            EXPECT_FLOAT_EQ(a.get_elevation_at(x, y), b.get_elevation_at(x, y));
        }
    }
}

TEST_F(ElevationModuleTest, RepeatedQueriesAreStable) {
    ElevationModule module;
    module.generate(context_);
    float first = module.get_elevation_at(5, -7);
    for (int i = 0; i < 10; ++i) {
        EXPECT_FLOAT_EQ(module.get_elevation_at(5, -7), first);
    }
}

TEST_F(ElevationModuleTest, OutsideBoundsComputedOnDemand) {
    ElevationModule module;
    module.generate(context_);
    float outside = module.get_elevation_at(500, 500);
    EXPECT_GE(outside, 0.0f);
    EXPECT_LE(outside, 1.0f);
}

TEST_F(ElevationModuleTest, MissingGeologyFails) {
    ElevationModule module;
    WorldContext empty(BOUNDS, 42);
    EXPECT_THROW(module.generate(empty), std::runtime_error);
    EXPECT_FALSE(module.is_generated());
}

TEST_F(ElevationModuleTest, FallbackHillsWithoutGeology) {
    ElevationConfig config;
    config.use_geology = false;
    ElevationModule module(config);
    module.generate(WorldContext(BOUNDS, 42));

    EXPECT_FALSE(module.is_using_geology());
    float highest = 0.0f;
    for (int x = BOUNDS.min_x; x <= BOUNDS.max_x; ++x) {
        for (int y = BOUNDS.min_y; y <= BOUNDS.max_y; ++y) {
            highest = std::max(highest, module.get_elevation_at(x, y));
        }
    }
    EXPECT_GT(highest, config.base_elevation) << "Hills should rise above sea level";
}

TEST_F(ElevationModuleTest, InvalidSettingsThrow) {
    ElevationConfig config;
    config.base_elevation = 1.5f;
    ElevationModule module(config);
    EXPECT_THROW(module.generate(context_), ConfigurationError);

    ElevationConfig hills;
    hills.use_geology = false;
    hills.min_hill_radius = 30.0f;
    hills.max_hill_radius = 10.0f;
    ElevationModule inverted(hills);
    EXPECT_THROW(inverted.generate(context_), ConfigurationError);
}

TEST_F(ElevationModuleTest, HardRockRaisesElevation) {
    GeologyConfig hard;
    hard.formations = {FormationTemplate{"granite", 3, 25.0f, 35.0f, RockType::Hard, 1.0f}};
    hard.perturbation_noise_threshold = 2.0f;
    GeologyModule hard_geology(hard);
    hard_geology.generate(WorldContext(BOUNDS, 42));

    GeologyConfig soft;
    soft.formations = {FormationTemplate{"limestone", 3, 25.0f, 35.0f, RockType::Soft, -0.3f}};
    soft.perturbation_noise_threshold = 2.0f;
    GeologyModule soft_geology(soft);
    soft_geology.generate(WorldContext(BOUNDS, 42));

    auto mean_elevation = [](const GeologyModule& geology) {
        WorldContext context(BOUNDS, 42);
        context.bind_module(GeologyModule::NAME, &geology);
        ElevationModule module;
        module.generate(context);
        double total = 0.0;
        int samples = 0;
        for (int x = BOUNDS.min_x; x <= BOUNDS.max_x; x += 4) {
            for (int y = BOUNDS.min_y; y <= BOUNDS.max_y; y += 4) {
                total += module.get_elevation_at(x, y);
                ++samples;
            }
        }
        return total / samples;
    };

    EXPECT_GT(mean_elevation(hard_geology), mean_elevation(soft_geology));
}

TEST_F(ElevationModuleTest, GradientUsesEastAndNorthNeighbours) {
    ElevationModule module;
    module.generate(context_);

    auto gradient = module.get_gradient(0, 0);
    EXPECT_FLOAT_EQ(gradient.dx, module.get_elevation_at(1, 0) - module.get_elevation_at(0, 0));
    EXPECT_FLOAT_EQ(gradient.dy, module.get_elevation_at(0, 0) - module.get_elevation_at(0, -1));
    EXPECT_GE(gradient.magnitude, 0.0f);
}

TEST_F(ElevationModuleTest, SampleCarriesElevation) {
    ElevationModule module;
    module.generate(context_);
    ModuleSample sample = module.get_data_at(3, 3, context_);
    EXPECT_FALSE(sample.terrain.has_value());
    EXPECT_FLOAT_EQ(sample.value_or("elevation", -1.0f), module.get_elevation_at(3, 3));
    EXPECT_EQ(sample.features.front().rfind("elevation-", 0), 0u);
}

}  // namespace
}  // namespace tileworld::world
