// TileWorld Entity System
// movement_rules.hpp - Per-entity terrain affordances

#pragma once

#include <tileworld/world/types.hpp>

#include <map>
#include <set>
#include <string>

namespace tileworld::entity {

// Which terrain kinds an entity may enter. cannot_walk_on wins over
// can_walk_on; special_access only applies to kinds in neither set and
// needs the entity to hold the named access tag.
struct MovementRules {
    std::set<world::TerrainKind> can_walk_on;
    std::set<world::TerrainKind> cannot_walk_on;
    std::map<world::TerrainKind, std::string> special_access;

    [[nodiscard]] bool forbids(world::TerrainKind kind) const { return cannot_walk_on.count(kind) > 0; }
    [[nodiscard]] bool allows(world::TerrainKind kind) const { return can_walk_on.count(kind) > 0; }

    // Access tag required for `kind`, or nullptr
    [[nodiscard]] const std::string* required_access(world::TerrainKind kind) const {
        auto it = special_access.find(kind);
        return it != special_access.end() ? &it->second : nullptr;
    }

    // Wildlife and companions
    [[nodiscard]] static MovementRules defaults();

    // Defaults plus mountains
    [[nodiscard]] static MovementRules player();
};

}  // namespace tileworld::entity
