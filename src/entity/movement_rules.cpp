// TileWorld Entity System
// movement_rules.cpp - Built-in rule sets

#include <tileworld/entity/movement_rules.hpp>

namespace tileworld::entity {

using world::TerrainKind;

MovementRules MovementRules::defaults() {
    MovementRules rules;
    rules.can_walk_on = {TerrainKind::Plains, TerrainKind::Forest, TerrainKind::Foothills, TerrainKind::Road,
                         TerrainKind::Trail};
    rules.cannot_walk_on = {TerrainKind::River, TerrainKind::Lake, TerrainKind::Mountain, TerrainKind::Building,
                            TerrainKind::Village};
    rules.special_access = {{TerrainKind::Building, "door"}};
    return rules;
}

MovementRules MovementRules::player() {
    MovementRules rules = defaults();
    rules.can_walk_on.insert(TerrainKind::Mountain);
    rules.cannot_walk_on = {TerrainKind::River, TerrainKind::Lake, TerrainKind::Building, TerrainKind::Village};
    return rules;
}

}  // namespace tileworld::entity
