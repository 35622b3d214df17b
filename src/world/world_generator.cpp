// TileWorld World System
// world_generator.cpp - Dependency-ordered terrain module pipeline

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <map>
#include <set>
#include <tileworld/core/clock.hpp>
#include <tileworld/core/logger.hpp>
#include <tileworld/world/elevation_module.hpp>
#include <tileworld/world/geology_module.hpp>
#include <tileworld/world/hydrology_module.hpp>
#include <tileworld/world/terrain_settings.hpp>
#include <tileworld/world/world_generator.hpp>
#include <unordered_map>

namespace tileworld::world {

namespace {

core::Status invalid(std::string message, std::string module = {}) {
    return core::Status::error(core::ErrorCode::ConfigurationInvalid, std::move(message), std::move(module));
}

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

float clamp01(float value) {
    return std::clamp(value, 0.0f, 1.0f);
}

}  // namespace

// ============================================================================
// Generation Order
// ============================================================================

core::Status resolve_generation_order(const std::vector<const TerrainModule*>& modules,
                                      std::vector<std::string>& order) {
    order.clear();

    std::map<std::string, const TerrainModule*, std::less<>> by_name;
    for (const TerrainModule* module : modules) {
        std::string name(module->get_name());
        if (!by_name.emplace(name, module).second) {
            return invalid(fmt::format("module '{}' is listed more than once", name), name);
        }
    }

    // Remaining unresolved dependencies per module
    std::map<std::string, std::set<std::string>, std::less<>> pending;
    for (const auto& [name, module] : by_name) {
        auto& deps = pending[name];
        for (const auto& dependency : module->get_dependencies()) {
            if (by_name.find(dependency) == by_name.end()) {
                return invalid(fmt::format("module '{}' depends on '{}', which is not loaded", name, dependency),
                               name);
            }
            deps.insert(dependency);
        }
    }

    while (!pending.empty()) {
        const TerrainModule* best = nullptr;
        for (const auto& [name, deps] : pending) {
            if (!deps.empty()) {
                continue;
            }
            const TerrainModule* candidate = by_name.at(name);
            // Map iteration is name-ordered, so strict comparison keeps the smaller name on ties
            if (best == nullptr || candidate->get_priority() > best->get_priority()) {
                best = candidate;
            }
        }

        if (best == nullptr) {
            std::vector<std::string> remaining;
            for (const auto& [name, deps] : pending) {
                remaining.push_back(name);
            }
            return invalid(fmt::format("dependency cycle among modules: {}", join_names(remaining)));
        }

        std::string resolved(best->get_name());
        pending.erase(resolved);
        for (auto& [name, deps] : pending) {
            deps.erase(resolved);
        }
        order.push_back(std::move(resolved));
    }
    return core::Status::ok();
}

// ============================================================================
// Implementation Details
// ============================================================================

struct WorldGenerator::Impl {
    const TerrainSettings& settings;
    const ModuleRegistry& registry;

    WorldContext context;
    std::vector<std::unique_ptr<TerrainModule>> modules;  // Generation order
    std::vector<std::string> order;
    float base_elevation = 0.2f;
    size_t max_cached_samples = PerformanceConfig{}.max_cached_samples;
    bool initialized = false;

    mutable std::unordered_map<std::string, std::unordered_map<Position, ModuleSample>> cache;

    Impl(const TerrainSettings& s, const ModuleRegistry& r) : settings(s), registry(r) {}

    [[nodiscard]] const TerrainModule* find(std::string_view name) const {
        for (const auto& module : modules) {
            if (module->get_name() == name) {
                return module.get();
            }
        }
        return nullptr;
    }

    core::Status create(const std::string& name, std::unique_ptr<TerrainModule>& out) const {
        if (!registry.has_module_type(name)) {
            return core::Status::error(core::ErrorCode::UnknownModule,
                                       fmt::format("no terrain module registered as '{}'", name), name);
        }
        try {
            out = registry.create_module(name, settings);
        } catch (const std::exception& e) {
            return invalid(fmt::format("cannot configure module '{}': {}", name, e.what()), name);
        }
        if (!out) {
            return core::Status::error(core::ErrorCode::ModuleGenerationFailure,
                                       fmt::format("factory for '{}' returned no module", name), name);
        }
        if (out->get_name() != name) {
            return invalid(fmt::format("factory for '{}' built module '{}'", name, out->get_name()), name);
        }
        return core::Status::ok();
    }

    static core::Status generate_one(TerrainModule& module, WorldContext& trial) {
        std::string name(module.get_name());
        TILEWORLD_LOG_INFO(core::log_category::TERRAIN, "Generating module '{}'", name);
        try {
            module.generate(trial);
        } catch (const ConfigurationError& e) {
            TILEWORLD_LOG_ERROR(core::log_category::TERRAIN, "Module '{}' configuration invalid: {}", name, e.what());
            return invalid(e.what(), name);
        } catch (const std::exception& e) {
            TILEWORLD_LOG_ERROR(core::log_category::TERRAIN, "Module '{}' failed to generate: {}", name, e.what());
            return core::Status::error(core::ErrorCode::ModuleGenerationFailure, e.what(), name);
        }
        trial.bind_module(name, &module);
        TILEWORLD_LOG_DEBUG(core::log_category::TERRAIN, "Module '{}' generated", name);
        return core::Status::ok();
    }

    static void sort_by_order(std::vector<std::unique_ptr<TerrainModule>>& list,
                              const std::vector<std::string>& resolved) {
        auto rank = [&resolved](const std::unique_ptr<TerrainModule>& module) {
            return std::find(resolved.begin(), resolved.end(), module->get_name()) - resolved.begin();
        };
        std::sort(list.begin(), list.end(), [&rank](const auto& a, const auto& b) { return rank(a) < rank(b); });
    }

    void commit(std::vector<std::unique_ptr<TerrainModule>> fresh, WorldContext trial,
                std::vector<std::string> resolved) {
        modules = std::move(fresh);
        context = std::move(trial);
        order = std::move(resolved);
        initialized = true;
        cache.clear();

        try {
            base_elevation = settings.get_elevation_config().base_elevation;
            max_cached_samples = std::max<size_t>(1, settings.get_performance_config().max_cached_samples);
        } catch (const std::exception& e) {
            TILEWORLD_LOG_WARN(core::log_category::TERRAIN, "Keeping base elevation {}: {}", base_elevation,
                               e.what());
        }
    }

    core::Status build_all() {
        TILEWORLD_SCOPED_TIMER(core::log_category::TERRAIN, "World generation");

        WorldConfig world;
        try {
            world = settings.get_world_config();
        } catch (const std::exception& e) {
            return invalid(fmt::format("malformed world section: {}", e.what()));
        }
        if (!world.bounds.is_valid()) {
            return invalid("world bounds are empty");
        }

        std::vector<std::unique_ptr<TerrainModule>> fresh;
        std::vector<const TerrainModule*> views;
        for (const auto& name : world.modules) {
            std::unique_ptr<TerrainModule> module;
            if (auto status = create(name, module); !status) {
                return status;
            }
            views.push_back(module.get());
            fresh.push_back(std::move(module));
        }

        std::vector<std::string> resolved;
        if (auto status = resolve_generation_order(views, resolved); !status) {
            return status;
        }
        sort_by_order(fresh, resolved);

        WorldContext trial(world.bounds, world.seed);
        for (auto& module : fresh) {
            if (auto status = generate_one(*module, trial); !status) {
                return status;
            }
        }

        commit(std::move(fresh), std::move(trial), std::move(resolved));
        TILEWORLD_LOG_INFO(core::log_category::TERRAIN, "World generated with modules [{}], seed {}",
                           join_names(order), world.seed);
        return core::Status::ok();
    }
};

// ============================================================================
// World Generator
// ============================================================================

WorldGenerator::WorldGenerator(const TerrainSettings& settings, const ModuleRegistry& registry)
    : impl_(std::make_unique<Impl>(settings, registry)) {}

WorldGenerator::~WorldGenerator() = default;

core::Status WorldGenerator::initialize() {
    return impl_->build_all();
}

core::Status WorldGenerator::regenerate_all() {
    return impl_->build_all();
}

core::Status WorldGenerator::regenerate_module(std::string_view name) {
    if (!impl_->initialized) {
        return core::Status::error(core::ErrorCode::ModuleGenerationFailure, "world generator is not initialized",
                                   std::string(name));
    }
    if (impl_->find(name) == nullptr) {
        return core::Status::error(core::ErrorCode::UnknownModule,
                                   fmt::format("module '{}' is not loaded", name), std::string(name));
    }

    TILEWORLD_SCOPED_TIMER(core::log_category::TERRAIN, "Module regeneration");

    // The named module plus everything downstream of it
    std::set<std::string, std::less<>> affected{std::string(name)};
    for (const auto& module : impl_->modules) {
        for (const auto& dependency : module->get_dependencies()) {
            if (affected.count(dependency) > 0) {
                affected.emplace(module->get_name());
                break;
            }
        }
    }

    std::vector<std::unique_ptr<TerrainModule>> fresh;
    std::vector<const TerrainModule*> views;
    for (const auto& module : impl_->modules) {
        std::string module_name(module->get_name());
        if (affected.count(module_name) == 0) {
            views.push_back(module.get());
            continue;
        }
        std::unique_ptr<TerrainModule> rebuilt;
        if (auto status = impl_->create(module_name, rebuilt); !status) {
            return status;
        }
        views.push_back(rebuilt.get());
        fresh.push_back(std::move(rebuilt));
    }

    std::vector<std::string> resolved;
    if (auto status = resolve_generation_order(views, resolved); !status) {
        return status;
    }

    WorldContext trial = impl_->context;
    for (const auto& module_name : affected) {
        trial.unbind_module(module_name);
    }
    Impl::sort_by_order(fresh, resolved);
    for (auto& module : fresh) {
        if (auto status = Impl::generate_one(*module, trial); !status) {
            return status;
        }
    }

    // Splice rebuilt modules in next to the untouched ones
    std::vector<std::unique_ptr<TerrainModule>> combined;
    combined.reserve(impl_->modules.size());
    for (auto& module : impl_->modules) {
        if (affected.count(module->get_name()) == 0) {
            combined.push_back(std::move(module));
        }
    }
    for (auto& module : fresh) {
        combined.push_back(std::move(module));
    }
    Impl::sort_by_order(combined, resolved);

    impl_->commit(std::move(combined), std::move(trial), std::move(resolved));
    TILEWORLD_LOG_INFO(core::log_category::TERRAIN, "Regenerated modules [{}]",
                       join_names(std::vector<std::string>(affected.begin(), affected.end())));
    return core::Status::ok();
}

bool WorldGenerator::is_initialized() const {
    return impl_->initialized;
}

const WorldContext& WorldGenerator::get_context() const {
    return impl_->context;
}

const std::vector<std::string>& WorldGenerator::get_generation_order() const {
    return impl_->order;
}

const TerrainModule* WorldGenerator::get_module(std::string_view name) const {
    return impl_->find(name);
}

ModuleSample WorldGenerator::get_module_data(std::string_view name, int32_t x, int32_t y) const {
    const TerrainModule* module = impl_->find(name);
    if (module == nullptr) {
        return {};
    }

    auto& module_cache = impl_->cache[std::string(name)];
    Position pos{x, y};
    auto it = module_cache.find(pos);
    if (it != module_cache.end()) {
        return it->second;
    }

    ModuleSample sample = module->get_data_at(x, y, impl_->context);
    if (module_cache.size() >= impl_->max_cached_samples) {
        TILEWORLD_LOG_DEBUG(core::log_category::TERRAIN, "Dropping {} cached samples of '{}'", module_cache.size(),
                            name);
        module_cache.clear();
    }
    module_cache.emplace(pos, sample);
    return sample;
}

ModuleSample WorldGenerator::sample_at(int32_t x, int32_t y) const {
    ModuleSample merged;
    for (const auto& name : impl_->order) {
        ModuleSample sample = get_module_data(name, x, y);
        if (sample.terrain) {
            merged.terrain = sample.terrain;
        }
        merged.features.insert(merged.features.end(), sample.features.begin(), sample.features.end());
        for (const auto& [key, value] : sample.values) {
            merged.values[key] = value;
        }
    }
    return merged;
}

float WorldGenerator::get_elevation_at(int32_t x, int32_t y) const {
    if (const auto* elevation = get_module_as<ElevationModule>(ElevationModule::NAME)) {
        return elevation->get_elevation_at(x, y);
    }
    return impl_->base_elevation;
}

PositionAnalysis WorldGenerator::analyze_position(int32_t x, int32_t y) const {
    PositionAnalysis analysis;
    analysis.position = Position{x, y};
    analysis.in_bounds = impl_->context.is_in_bounds(x, y);
    analysis.elevation = get_elevation_at(x, y);
    analysis.features = sample_at(x, y).features;

    if (const auto* elevation = get_module_as<ElevationModule>(ElevationModule::NAME)) {
        analysis.slope = elevation->get_gradient(x, y).magnitude;
    }

    bool hard_rock = false;
    if (const auto* geology = get_module_as<GeologyModule>(GeologyModule::NAME)) {
        analysis.rock_type = geology->get_rock_type_at(x, y);
        analysis.soil_quality = geology->get_soil_quality_at(x, y);
        analysis.water_retention = geology->get_water_retention_at(x, y);
        hard_rock = analysis.rock_type == RockType::Hard;
    }

    if (const auto* hydrology = get_module_as<HydrologyModule>(HydrologyModule::NAME)) {
        analysis.moisture = hydrology->get_moisture_at(x, y);
        analysis.is_lake = hydrology->is_in_lake(x, y);
        analysis.is_river = hydrology->is_on_river(x, y);
        analysis.is_water = analysis.is_lake || analysis.is_river;
    }

    if (analysis.is_water) {
        return analysis;
    }

    const float flatness = 1.0f - std::min(1.0f, analysis.slope * 10.0f);
    analysis.settlement_suitability =
        clamp01(flatness * 0.4f + analysis.moisture * 0.3f + analysis.soil_quality * 0.3f);
    analysis.agriculture_suitability =
        clamp01(analysis.soil_quality * 0.5f + analysis.moisture * 0.3f + flatness * 0.2f);
    analysis.defense_suitability =
        clamp01(analysis.elevation * 0.6f + (1.0f - flatness) * 0.2f + (hard_rock ? 0.2f : 0.0f));
    return analysis;
}

void WorldGenerator::clear_cache() {
    impl_->cache.clear();
}

size_t WorldGenerator::get_cache_size() const {
    size_t total = 0;
    for (const auto& [name, entries] : impl_->cache) {
        total += entries.size();
    }
    return total;
}

}  // namespace tileworld::world
