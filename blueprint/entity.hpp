#ifndef FURNACELINE_BLUEPRINT_ENTITY_HPP
#define FURNACELINE_BLUEPRINT_ENTITY_HPP

#include <math/vec2.hpp>
#include <math/direction.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace furnaceline {

using EntityNumber = uint32_t;

// One placed game object
struct Entity {
    std::string name;
    Vec2 position;
    std::optional<Direction> direction;  // Absent for non-orientable entities

    // 1-based, assigned once placement and rotation are final (0 = unassigned)
    EntityNumber entity_number = 0;

    bool operator==(const Entity& other) const = default;
};

}  // namespace furnaceline

#endif // FURNACELINE_BLUEPRINT_ENTITY_HPP
