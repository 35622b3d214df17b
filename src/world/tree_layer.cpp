// TileWorld World System
// tree_layer.cpp - Forest patches and scattered trees

#include <algorithm>
#include <cmath>
#include <tileworld/core/logger.hpp>
#include <tileworld/world/noise.hpp>
#include <tileworld/world/tree_layer.hpp>

namespace tileworld::world {

namespace {

constexpr int64_t PATCH_SALT = 0x5452454550;
constexpr int64_t SCATTER_SALT = 0x5343415454;
constexpr int64_t TREE_SEED_OFFSET = 5000;

}  // namespace

void TreeLayer::generate(const WorldBounds& bounds, int64_t seed, const TreeConfig& config,
                         const TerrainLookup& terrain) {
    clear();
    if (!config.enabled || config.max_trees <= 0) {
        return;
    }

    // Footprint plus margin must fit inside bounds
    const int32_t inset = config.boundary_margin + 1;
    const int32_t min_x = bounds.min_x + inset;
    const int32_t max_x = bounds.max_x - inset;
    const int32_t min_y = bounds.min_y + inset;
    const int32_t max_y = bounds.max_y - inset;
    if (min_x > max_x || min_y > max_y) {
        TILEWORLD_LOG_DEBUG(core::log_category::WORLD, "World too small for trees");
        return;
    }

    const int64_t tree_seed = seed + TREE_SEED_OFFSET;

    for (int patch = 0; patch < config.forest_patch_count; ++patch) {
        const int64_t base = tree_seed + static_cast<int64_t>(patch) * 1000;
        Position center{random_int(base, PATCH_SALT, min_x, max_x), random_int(base + 1000, PATCH_SALT, min_y, max_y)};
        int32_t radius = random_int(base + 2000, PATCH_SALT, config.min_patch_radius,
                                    std::max(config.min_patch_radius, config.max_patch_radius));

        const double area = 3.14159265358979323846 * radius * radius;
        const int attempts = static_cast<int>(std::ceil(area * config.patch_density));
        for (int i = 0; i < attempts; ++i) {
            if (static_cast<int>(trees_.size()) >= config.max_trees) {
                break;
            }
            const int64_t sample = base + 3000 + static_cast<int64_t>(i) * 7;
            double angle = random_unit(sample, PATCH_SALT) * 2.0 * 3.14159265358979323846;
            double distance = std::sqrt(random_unit(sample + 1, PATCH_SALT)) * radius;
            Position trunk{center.x + static_cast<int32_t>(std::lround(std::cos(angle) * distance)),
                           center.y + static_cast<int32_t>(std::lround(std::sin(angle) * distance))};
            if (trunk.x >= min_x && trunk.x <= max_x && trunk.y >= min_y && trunk.y <= max_y) {
                try_place(trunk, true, config, bounds, terrain);
            }
        }
    }

    for (int i = 0; i < config.scattered_tree_count; ++i) {
        if (static_cast<int>(trees_.size()) >= config.max_trees) {
            break;
        }
        const int64_t sample = tree_seed + 100000 + static_cast<int64_t>(i) * 1000;
        Position trunk{random_int(sample, SCATTER_SALT, min_x, max_x),
                       random_int(sample + 1000, SCATTER_SALT, min_y, max_y)};
        try_place(trunk, false, config, bounds, terrain);
    }

    TILEWORLD_LOG_DEBUG(core::log_category::WORLD, "Placed {} trees", trees_.size());
}

void TreeLayer::clear() {
    trees_.clear();
    features_.clear();
}

bool TreeLayer::try_place(const Position& trunk, bool in_patch, const TreeConfig& config, const WorldBounds& bounds,
                          const TerrainLookup& terrain) {
    for (const auto& tree : trees_) {
        if (euclidean_distance(tree.trunk, trunk) < config.min_tree_spacing) {
            return false;
        }
    }
    for (int32_t dy = -1; dy <= 1; ++dy) {
        for (int32_t dx = -1; dx <= 1; ++dx) {
            int32_t x = trunk.x + dx;
            int32_t y = trunk.y + dy;
            if (!bounds.contains(x, y) || terrain(x, y) != TerrainKind::Plains) {
                return false;
            }
            // Never put a canopy over an existing trunk
            auto it = features_.find(Position{x, y});
            if ((dx != 0 || dy != 0) && it != features_.end() && it->second.type == FeatureType::TreeTrunk) {
                return false;
            }
        }
    }

    Tree tree;
    tree.id = static_cast<uint32_t>(trees_.size()) + 1;
    tree.trunk = trunk;
    tree.in_patch = in_patch;

    for (int32_t dy = -1; dy <= 1; ++dy) {
        for (int32_t dx = -1; dx <= 1; ++dx) {
            Position pos{trunk.x + dx, trunk.y + dy};
            if (dx == 0 && dy == 0) {
                features_[pos] = TileFeature{FeatureType::TreeTrunk, tree.id, trunk};
            } else {
                // Earlier canopy keeps its owner
                features_.emplace(pos, TileFeature{FeatureType::TreeCanopy, tree.id, trunk});
            }
        }
    }

    trees_.push_back(tree);
    return true;
}

std::optional<TileFeature> TreeLayer::get_feature_at(int32_t x, int32_t y) const {
    auto it = features_.find(Position{x, y});
    if (it == features_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TreeLayer::has_trunk_at(int32_t x, int32_t y) const {
    auto it = features_.find(Position{x, y});
    return it != features_.end() && it->second.type == FeatureType::TreeTrunk;
}

}  // namespace tileworld::world
