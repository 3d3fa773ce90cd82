#ifndef FURNACELINE_MATH_DIRECTION_HPP
#define FURNACELINE_MATH_DIRECTION_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace furnaceline {

// Entity orientation in 45 degree steps, matching the exchange format.
// Only the axis-aligned values are placed by the layout builder.
enum class Direction : uint8_t {
    North = 0,
    NorthEast = 1,
    East = 2,
    SouthEast = 3,
    South = 4,
    SouthWest = 5,
    West = 6,
    NorthWest = 7
};

// Side of the furnace line a belt enters or leaves from
enum class Side { North, East, South, West };

constexpr int to_int(Direction direction) {
    return static_cast<int>(direction);
}

// Accepts any integer and wraps it into [0, 7]
constexpr Direction direction_from_int(int value) {
    return static_cast<Direction>(((value % 8) + 8) % 8);
}

constexpr Direction to_direction(Side side) {
    switch (side) {
        case Side::North: return Direction::North;
        case Side::East: return Direction::East;
        case Side::South: return Direction::South;
        case Side::West: return Direction::West;
    }
    return Direction::North;
}

constexpr Side opposite(Side side) {
    switch (side) {
        case Side::North: return Side::South;
        case Side::East: return Side::West;
        case Side::South: return Side::North;
        case Side::West: return Side::East;
    }
    return Side::North;
}

// Quarter turns that bring north onto `side` (cyclic order N, E, S, W)
constexpr int rotation_steps_for(Side side) {
    return static_cast<int>(side);
}

constexpr std::array<Side, 4> all_sides() {
    return {Side::North, Side::East, Side::South, Side::West};
}

std::string to_string(Side side);

// Throws UnknownIdentifierError for anything but north/east/south/west
Side parse_side(std::string_view name);

}  // namespace furnaceline

#endif // FURNACELINE_MATH_DIRECTION_HPP
