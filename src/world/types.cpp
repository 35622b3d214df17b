// TileWorld World System
// types.cpp - Vocabulary conversions

#include <tileworld/world/types.hpp>

#include <charconv>

namespace tileworld::world {

std::string position_key(int32_t x, int32_t y) {
    return std::to_string(x) + "," + std::to_string(y);
}

std::optional<Position> parse_position_key(std::string_view key) {
    auto comma = key.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }

    int32_t x = 0;
    int32_t y = 0;
    auto x_part = key.substr(0, comma);
    auto y_part = key.substr(comma + 1);
    auto [x_end, x_err] = std::from_chars(x_part.data(), x_part.data() + x_part.size(), x);
    auto [y_end, y_err] = std::from_chars(y_part.data(), y_part.data() + y_part.size(), y);
    if (x_err != std::errc{} || y_err != std::errc{} || x_end != x_part.data() + x_part.size() ||
        y_end != y_part.data() + y_part.size()) {
        return std::nullopt;
    }
    return Position(x, y);
}

const char* terrain_kind_to_string(TerrainKind kind) {
    switch (kind) {
        case TerrainKind::Plains:
            return "plains";
        case TerrainKind::Forest:
            return "forest";
        case TerrainKind::Foothills:
            return "foothills";
        case TerrainKind::Mountain:
            return "mountain";
        case TerrainKind::Road:
            return "road";
        case TerrainKind::Trail:
            return "trail";
        case TerrainKind::River:
            return "river";
        case TerrainKind::Lake:
            return "lake";
        case TerrainKind::Building:
            return "building";
        case TerrainKind::Village:
            return "village";
        case TerrainKind::Unknown:
            return "unknown";
        default:
            return "unknown";
    }
}

std::optional<TerrainKind> terrain_kind_from_string(std::string_view name) {
    for (size_t i = 0; i < TERRAIN_KIND_COUNT; ++i) {
        auto kind = static_cast<TerrainKind>(i);
        if (name == terrain_kind_to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

const char* rock_type_to_string(RockType type) {
    switch (type) {
        case RockType::Hard:
            return "hard";
        case RockType::Soft:
            return "soft";
        case RockType::Clay:
            return "clay";
        default:
            return "soft";
    }
}

std::optional<RockType> rock_type_from_string(std::string_view name) {
    if (name == "hard") return RockType::Hard;
    if (name == "soft") return RockType::Soft;
    if (name == "clay") return RockType::Clay;
    return std::nullopt;
}

const char* feature_type_to_string(FeatureType type) {
    switch (type) {
        case FeatureType::TreeTrunk:
            return "tree_trunk";
        case FeatureType::TreeCanopy:
            return "tree_canopy";
        default:
            return "unknown";
    }
}

}  // namespace tileworld::world
