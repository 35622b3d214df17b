// TileWorld World System
// tree_layer.hpp - Seeded tree placement producing trunk and canopy features

#pragma once

#include "types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tileworld::world {

struct TreeConfig {
    bool enabled = true;
    int forest_patch_count = 3;
    int min_patch_radius = 15;
    int max_patch_radius = 24;
    float patch_density = 0.08f;   // Candidate trunks per patch cell
    int scattered_tree_count = 15;
    int max_trees = 50;
    float min_tree_spacing = 2.0f;  // Between trunks
    int boundary_margin = 2;
};

struct Tree {
    uint32_t id = 0;
    Position trunk{0, 0};
    bool in_patch = false;
};

// Trees occupy a 3x3 footprint: trunk at the centre, canopy around it.
// Trees are only placed where the whole footprint is plains.
class TreeLayer {
public:
    using TerrainLookup = std::function<TerrainKind(int32_t x, int32_t y)>;

    TreeLayer() = default;

    void generate(const WorldBounds& bounds, int64_t seed, const TreeConfig& config, const TerrainLookup& terrain);
    void clear();

    [[nodiscard]] std::optional<TileFeature> get_feature_at(int32_t x, int32_t y) const;
    [[nodiscard]] bool has_trunk_at(int32_t x, int32_t y) const;

    [[nodiscard]] const std::vector<Tree>& get_trees() const { return trees_; }
    [[nodiscard]] size_t get_tree_count() const { return trees_.size(); }

private:
    bool try_place(const Position& trunk, bool in_patch, const TreeConfig& config, const WorldBounds& bounds,
                   const TerrainLookup& terrain);

    std::vector<Tree> trees_;
    std::unordered_map<Position, TileFeature> features_;
};

}  // namespace tileworld::world
