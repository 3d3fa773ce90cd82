#ifndef FURNACELINE_BLUEPRINT_BLUEPRINT_HPP
#define FURNACELINE_BLUEPRINT_BLUEPRINT_HPP

#include "entity.hpp"
#include <factory/catalog.hpp>
#include <math/direction.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace furnaceline {

// Icon slot shown on the blueprint item
struct Icon {
    std::string signal_type = "item";
    std::string signal_name;
    uint32_t index = 1;
};

// Resolved settings carried alongside the standard schema
struct BlueprintMetadata {
    Side input_side = Side::North;
    Side output_side = Side::South;
    BeltType belt = BeltType::Transport;
    int furnace_count = 0;
};

// Exchange-format blueprint document
struct Blueprint {
    static constexpr const char* ITEM = "blueprint";
    static constexpr int VERSION = 0;

    std::string label;
    std::vector<Entity> entities;
    std::vector<Icon> icons;
    BlueprintMetadata metadata;

    size_t entity_count() const { return entities.size(); }
};

}  // namespace furnaceline

#endif // FURNACELINE_BLUEPRINT_BLUEPRINT_HPP
