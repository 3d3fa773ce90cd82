#include "direction.hpp"
#include <common/errors.hpp>

namespace furnaceline {

std::string to_string(Side side) {
    switch (side) {
        case Side::North: return "north";
        case Side::East: return "east";
        case Side::South: return "south";
        case Side::West: return "west";
    }
    return "north";
}

Side parse_side(std::string_view name) {
    for (Side side : all_sides()) {
        if (name == to_string(side)) {
            return side;
        }
    }
    throw UnknownIdentifierError("side", std::string(name), "north, east, south, west");
}

}  // namespace furnaceline
