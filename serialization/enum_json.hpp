#ifndef FURNACELINE_SERIALIZATION_ENUM_JSON_HPP
#define FURNACELINE_SERIALIZATION_ENUM_JSON_HPP

#include <nlohmann/json.hpp>
#include <factory/catalog.hpp>
#include <math/direction.hpp>
#include <string>

namespace furnaceline {

// Enums travel as their exchange identifiers. Reading goes through the
// parse_* functions so unknown names raise UnknownIdentifierError instead
// of silently mapping to a default.

template <typename BasicJsonType>
void to_json(BasicJsonType& j, FurnaceType furnace) {
    j = to_string(furnace);
}

template <typename BasicJsonType>
void from_json(const BasicJsonType& j, FurnaceType& furnace) {
    furnace = parse_furnace_type(j.template get<std::string>());
}

template <typename BasicJsonType>
void to_json(BasicJsonType& j, BeltType belt) {
    j = to_string(belt);
}

template <typename BasicJsonType>
void from_json(const BasicJsonType& j, BeltType& belt) {
    belt = parse_belt_type(j.template get<std::string>());
}

template <typename BasicJsonType>
void to_json(BasicJsonType& j, Side side) {
    j = to_string(side);
}

template <typename BasicJsonType>
void from_json(const BasicJsonType& j, Side& side) {
    side = parse_side(j.template get<std::string>());
}

// Directions are plain integers 0-7 in the exchange format
template <typename BasicJsonType>
void to_json(BasicJsonType& j, Direction direction) {
    j = to_int(direction);
}

template <typename BasicJsonType>
void from_json(const BasicJsonType& j, Direction& direction) {
    direction = direction_from_int(j.template get<int>());
}

}  // namespace furnaceline

#endif // FURNACELINE_SERIALIZATION_ENUM_JSON_HPP
