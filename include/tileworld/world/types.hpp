// TileWorld World System
// types.hpp - Positions, bounds, terrain and rock vocabularies

#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tileworld::world {

// ============================================================================
// Coordinate Types (using GLM)
// ============================================================================

// Integer tile position
using Position = glm::ivec2;

// Closed rectangle of valid tile positions
struct WorldBounds {
    int32_t min_x = -100;
    int32_t max_x = 100;
    int32_t min_y = -100;
    int32_t max_y = 100;

    [[nodiscard]] bool contains(int32_t x, int32_t y) const {
        return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    }
    [[nodiscard]] bool contains(const Position& pos) const { return contains(pos.x, pos.y); }

    [[nodiscard]] int32_t width() const { return max_x - min_x + 1; }
    [[nodiscard]] int32_t height() const { return max_y - min_y + 1; }
    [[nodiscard]] bool is_valid() const { return min_x <= max_x && min_y <= max_y; }

    // Positions on the outermost ring of the rectangle
    [[nodiscard]] bool is_boundary(int32_t x, int32_t y) const {
        return contains(x, y) && (x == min_x || x == max_x || y == min_y || y == max_y);
    }

    bool operator==(const WorldBounds&) const = default;
};

// "x,y" textual key, used only at the export boundary
[[nodiscard]] std::string position_key(int32_t x, int32_t y);
[[nodiscard]] std::optional<Position> parse_position_key(std::string_view key);

[[nodiscard]] inline double euclidean_distance(const Position& a, const Position& b) {
    double dx = static_cast<double>(a.x - b.x);
    double dy = static_cast<double>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

[[nodiscard]] inline double euclidean_distance(double ax, double ay, double bx, double by) {
    double dx = ax - bx;
    double dy = ay - by;
    return std::sqrt(dx * dx + dy * dy);
}

[[nodiscard]] inline int32_t chebyshev_distance(const Position& a, const Position& b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

// ============================================================================
// Neighbor Directions
// ============================================================================

// Eight-way neighbourhood, clockwise from north
inline constexpr glm::ivec2 NEIGHBOR_OFFSETS[8] = {{0, -1}, {1, -1}, {1, 0},  {1, 1},
                                                   {0, 1},  {-1, 1}, {-1, 0}, {-1, -1}};

// ============================================================================
// Terrain Kinds
// ============================================================================

enum class TerrainKind : uint8_t {
    Plains = 0,
    Forest,
    Foothills,
    Mountain,
    Road,
    Trail,
    River,
    Lake,
    Building,
    Village,
    Unknown,
    Count
};

inline constexpr size_t TERRAIN_KIND_COUNT = static_cast<size_t>(TerrainKind::Count);

[[nodiscard]] const char* terrain_kind_to_string(TerrainKind kind);
[[nodiscard]] std::optional<TerrainKind> terrain_kind_from_string(std::string_view name);

[[nodiscard]] inline bool is_water(TerrainKind kind) {
    return kind == TerrainKind::River || kind == TerrainKind::Lake;
}

// ============================================================================
// Rock Types
// ============================================================================

enum class RockType : uint8_t {
    Hard = 0,
    Soft,
    Clay,
    Count
};

inline constexpr size_t ROCK_TYPE_COUNT = static_cast<size_t>(RockType::Count);

[[nodiscard]] const char* rock_type_to_string(RockType type);
[[nodiscard]] std::optional<RockType> rock_type_from_string(std::string_view name);

// ============================================================================
// Tile Features
// ============================================================================

enum class FeatureType : uint8_t {
    TreeTrunk = 0,  // Blocks movement and sight
    TreeCanopy,     // Walkable, blocks sight, hides agents beneath it
    Count
};

[[nodiscard]] const char* feature_type_to_string(FeatureType type);

struct TileFeature {
    FeatureType type = FeatureType::TreeCanopy;
    uint32_t tree_id = 0;
    Position trunk{0, 0};

    bool operator==(const TileFeature&) const = default;
};

[[nodiscard]] inline bool blocks_sight(const TileFeature& feature) {
    return feature.type == FeatureType::TreeTrunk || feature.type == FeatureType::TreeCanopy;
}

}  // namespace tileworld::world

// ============================================================================
// Hash Functions for using positions as map keys
// ============================================================================

namespace std {

template <>
struct hash<tileworld::world::Position> {
    size_t operator()(const tileworld::world::Position& pos) const noexcept {
        size_t h1 = std::hash<int32_t>{}(pos.x);
        size_t h2 = std::hash<int32_t>{}(pos.y);
        return h1 ^ (h2 * 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace std
