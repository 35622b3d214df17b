// TileWorld World System Tests
// world_generator_test.cpp - Tests for module ordering and regeneration

#include <gtest/gtest.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <tileworld/core/config.hpp>
#include <tileworld/world/elevation_module.hpp>
#include <tileworld/world/geology_module.hpp>
#include <tileworld/world/hydrology_module.hpp>
#include <tileworld/world/terrain_settings.hpp>
#include <tileworld/world/world_generator.hpp>

namespace tileworld::world {
namespace {

// Module with a fixed name, priority and dependency list
class StubModule final : public TerrainModule {
public:
    StubModule(std::string name, int priority, std::vector<std::string> deps = {})
        : name_(std::move(name)), priority_(priority), deps_(std::move(deps)) {}

    [[nodiscard]] std::string_view get_name() const override { return name_; }
    [[nodiscard]] int get_priority() const override { return priority_; }
    [[nodiscard]] std::vector<std::string> get_dependencies() const override { return deps_; }
    void generate(const WorldContext&) override { generated_ = true; }
    [[nodiscard]] ModuleSample get_data_at(int32_t, int32_t, const WorldContext&) const override { return {}; }
    [[nodiscard]] bool is_generated() const override { return generated_; }

private:
    std::string name_;
    int priority_;
    std::vector<std::string> deps_;
    bool generated_ = false;
};

// Succeeds the first time it is built, then fails
class FlakyModule final : public TerrainModule {
public:
    explicit FlakyModule(std::shared_ptr<int> builds) : builds_(std::move(builds)) {}

    [[nodiscard]] std::string_view get_name() const override { return "flaky"; }
    [[nodiscard]] int get_priority() const override { return 10; }
    [[nodiscard]] std::vector<std::string> get_dependencies() const override { return {}; }
    void generate(const WorldContext&) override {
        if ((*builds_)++ > 0) {
            throw std::runtime_error("noise backend unavailable");
        }
        generated_ = true;
    }
    [[nodiscard]] ModuleSample get_data_at(int32_t, int32_t, const WorldContext&) const override {
        ModuleSample sample;
        sample.features.emplace_back("flaky");
        return sample;
    }
    [[nodiscard]] bool is_generated() const override { return generated_; }

private:
    std::shared_ptr<int> builds_;
    bool generated_ = false;
};

TEST(GenerationOrderTest, DependenciesFirstThenPriority) {
    StubModule hydrology("hydrology", 90, {"geology", "elevation"});
    StubModule elevation("elevation", 110, {"geology"});
    StubModule geology("geology", 120);
    StubModule decor("decor", 200);

    std::vector<std::string> order;
    auto status = resolve_generation_order({&hydrology, &elevation, &geology, &decor}, order);
    ASSERT_TRUE(status) << status.to_string();
    EXPECT_EQ(order, (std::vector<std::string>{"decor", "geology", "elevation", "hydrology"}));
}

TEST(GenerationOrderTest, EqualPriorityBreaksTiesByName) {
    StubModule b("beta", 5);
    StubModule a("alpha", 5);
    std::vector<std::string> order;
    ASSERT_TRUE(resolve_generation_order({&b, &a}, order));
    EXPECT_EQ(order, (std::vector<std::string>{"alpha", "beta"}));
}

TEST(GenerationOrderTest, CycleIsConfigurationError) {
    StubModule a("a", 1, {"b"});
    StubModule b("b", 1, {"a"});
    std::vector<std::string> order;
    auto status = resolve_generation_order({&a, &b}, order);
    EXPECT_EQ(status.code(), core::ErrorCode::ConfigurationInvalid);
    EXPECT_NE(status.message().find("cycle"), std::string::npos);
}

TEST(GenerationOrderTest, MissingDependencyIsConfigurationError) {
    StubModule hydrology("hydrology", 90, {"elevation"});
    std::vector<std::string> order;
    auto status = resolve_generation_order({&hydrology}, order);
    EXPECT_EQ(status.code(), core::ErrorCode::ConfigurationInvalid);
    EXPECT_EQ(status.module(), "hydrology");
}

TEST(GenerationOrderTest, DuplicateModuleRejected) {
    StubModule a("geology", 1);
    StubModule b("geology", 1);
    std::vector<std::string> order;
    EXPECT_FALSE(resolve_generation_order({&a, &b}, order));
}

class WorldGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.merge_section(core::config_section::WORLD,
                              {{"min_x", -30}, {"max_x", 30}, {"min_y", -30}, {"max_y", 30}, {"seed", 42}});
    }

    core::Config config_;
    ModuleRegistry registry_ = ModuleRegistry::with_defaults();
};

TEST_F(WorldGeneratorTest, InitializeBuildsDefaultPipeline) {
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    auto status = generator.initialize();
    ASSERT_TRUE(status) << status.to_string();

    EXPECT_TRUE(generator.is_initialized());
    EXPECT_EQ(generator.get_generation_order(), (std::vector<std::string>{"geology", "elevation", "hydrology"}));
    EXPECT_NE(generator.get_module_as<GeologyModule>("geology"), nullptr);
    EXPECT_NE(generator.get_module_as<HydrologyModule>("hydrology"), nullptr);
    EXPECT_EQ(generator.get_context().get_seed(), 42);
}

TEST_F(WorldGeneratorTest, UnknownModuleNameFails) {
    config_.set_value(core::config_section::WORLD, core::config_key::MODULES, nlohmann::json::array({"volcanoes"}));
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    auto status = generator.initialize();
    EXPECT_EQ(status.code(), core::ErrorCode::UnknownModule);
    EXPECT_FALSE(generator.is_initialized());
}

TEST_F(WorldGeneratorTest, MissingDependencyInWorldModules) {
    config_.set_value(core::config_section::WORLD, core::config_key::MODULES,
                      nlohmann::json::array({"elevation", "hydrology"}));
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    EXPECT_EQ(generator.initialize().code(), core::ErrorCode::ConfigurationInvalid);
}

TEST_F(WorldGeneratorTest, ModuleConfigurationErrorNamesModule) {
    config_.set_int(core::config_section::HYDROLOGY, "min_lake_radius", 30);
    config_.set_int(core::config_section::HYDROLOGY, "max_lake_radius", 5);
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    auto status = generator.initialize();
    EXPECT_EQ(status.code(), core::ErrorCode::ConfigurationInvalid);
    EXPECT_EQ(status.module(), "hydrology");
}

TEST_F(WorldGeneratorTest, SampleMergesModules) {
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    ASSERT_TRUE(generator.initialize());

    ModuleSample merged = generator.sample_at(0, 0);
    EXPECT_TRUE(merged.values.count("elevation"));
    EXPECT_TRUE(merged.values.count("soil_quality"));
    EXPECT_TRUE(merged.values.count("moisture"));
    EXPECT_FLOAT_EQ(merged.value_or("elevation", -1.0f), generator.get_elevation_at(0, 0));
}

TEST_F(WorldGeneratorTest, ModuleDataIsCached) {
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    ASSERT_TRUE(generator.initialize());

    EXPECT_EQ(generator.get_cache_size(), 0u);
    auto first = generator.get_module_data("elevation", 4, 4);
    auto second = generator.get_module_data("elevation", 4, 4);
    EXPECT_EQ(first.features, second.features);
    EXPECT_GE(generator.get_cache_size(), 1u);

    generator.clear_cache();
    EXPECT_EQ(generator.get_cache_size(), 0u);
    EXPECT_TRUE(generator.get_module_data("nonexistent", 0, 0).features.empty());
}

// Test: The per-module cache never grows past the configured sample limit
TEST_F(WorldGeneratorTest, ModuleCacheIsBounded) {
    config_.set_int(core::config_section::PERFORMANCE, "max_cached_samples", 4);
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    ASSERT_TRUE(generator.initialize());

    for (int32_t x = -10; x < 10; ++x) {
        auto cached = generator.get_module_data("elevation", x, 0);
        EXPECT_LE(generator.get_cache_size(), 4u);
        EXPECT_EQ(cached.values, generator.get_module_data("elevation", x, 0).values);
    }
    EXPECT_GE(generator.get_cache_size(), 1u);
}

TEST_F(WorldGeneratorTest, RegenerateModuleRebuildsDependents) {
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    ASSERT_TRUE(generator.initialize());

    const TerrainModule* old_geology = generator.get_module("geology");
    const TerrainModule* old_hydrology = generator.get_module("hydrology");

    ASSERT_TRUE(generator.regenerate_module("elevation"));
    EXPECT_EQ(generator.get_module("geology"), old_geology) << "Upstream modules are kept";
    EXPECT_NE(generator.get_module("hydrology"), old_hydrology) << "Downstream modules are rebuilt";
    EXPECT_EQ(generator.get_generation_order(), (std::vector<std::string>{"geology", "elevation", "hydrology"}));
}

TEST_F(WorldGeneratorTest, RegenerateModulePicksUpNewSettings) {
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    ASSERT_TRUE(generator.initialize());

    nlohmann::json formations = nlohmann::json::array(
        {{{"type", "granite_batholith"}, {"count", 6}, {"min_radius", 45}, {"max_radius", 90},
          {"rock_type", "hard"}, {"elevation_effect", 1.0}}});
    config_.set_value(core::config_section::GEOLOGY, "formations", formations);

    ASSERT_TRUE(generator.regenerate_module("geology"));
    const auto* geology = generator.get_module_as<GeologyModule>("geology");
    ASSERT_NE(geology, nullptr);
    EXPECT_EQ(geology->get_formations().size(), 6u);
    for (const auto& formation : geology->get_formations()) {
        EXPECT_EQ(formation.rock_type, RockType::Hard);
    }
}

TEST_F(WorldGeneratorTest, RegenerateUnknownModule) {
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    EXPECT_FALSE(generator.regenerate_module("geology")) << "Not initialized yet";
    ASSERT_TRUE(generator.initialize());
    EXPECT_EQ(generator.regenerate_module("volcanoes").code(), core::ErrorCode::UnknownModule);
}

TEST_F(WorldGeneratorTest, FailedRegenerationKeepsPriorFields) {
    auto builds = std::make_shared<int>(0);
    registry_.register_module_type("flaky", [builds](const TerrainSettings&) {
        return std::make_unique<FlakyModule>(builds);
    });
    config_.set_value(core::config_section::WORLD, core::config_key::MODULES,
                      nlohmann::json::array({"geology", "flaky"}));

    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    ASSERT_TRUE(generator.initialize());
    const TerrainModule* before = generator.get_module("flaky");

    auto status = generator.regenerate_module("flaky");
    EXPECT_EQ(status.code(), core::ErrorCode::ModuleGenerationFailure);
    EXPECT_EQ(status.module(), "flaky");
    EXPECT_EQ(generator.get_module("flaky"), before);
    EXPECT_TRUE(generator.get_module("flaky")->is_generated());
}

TEST_F(WorldGeneratorTest, AnalyzePositionScoresInUnitRange) {
    TerrainSettings settings(config_);
    WorldGenerator generator(settings, registry_);
    ASSERT_TRUE(generator.initialize());

    PositionAnalysis analysis = generator.analyze_position(3, -3);
    EXPECT_TRUE(analysis.in_bounds);
    EXPECT_TRUE(analysis.rock_type.has_value());
    for (float score : {analysis.settlement_suitability, analysis.agriculture_suitability,
                        analysis.defense_suitability}) {
        EXPECT_GE(score, 0.0f);
        EXPECT_LE(score, 1.0f);
    }
}

}  // namespace
}  // namespace tileworld::world
