#ifndef FURNACELINE_FACTORY_FURNACE_LINE_CONFIG_HPP
#define FURNACELINE_FACTORY_FURNACE_LINE_CONFIG_HPP

#include "catalog.hpp"
#include <math/direction.hpp>
#include <optional>
#include <string>

namespace furnaceline {

// Caller-supplied settings for one furnace line
struct FurnaceLineConfig {
    FurnaceType furnace = FurnaceType::Stone;
    BeltType belt = BeltType::Transport;

    // Explicit furnace count; when unset the count saturates one belt
    std::optional<int> length;

    Side input_side = Side::North;
    Side output_side = Side::South;   // Must be opposite input_side

    std::string label = "Furnace line";
};

}  // namespace furnaceline

#endif // FURNACELINE_FACTORY_FURNACE_LINE_CONFIG_HPP
