#ifndef FURNACELINE_MATH_ROTATION_HPP
#define FURNACELINE_MATH_ROTATION_HPP

#include "vec2.hpp"
#include "direction.hpp"

namespace furnaceline {

// Reduce an arbitrary (possibly negative) quarter-turn count into [0, 3]
constexpr int normalize_steps(int steps) {
    return ((steps % 4) + 4) % 4;
}

// Rotate a grid point by steps * 90 degrees.
// Uses exact swap/negate identities so repeated rotation never drifts:
//   0: (x, y)   1: (y, -x)   2: (-x, -y)   3: (-y, x)
Vec2 rotate_point(const Vec2& point, int steps);
Vec2 rotate_point(double x, double y, int steps);

// Rotate an orientation by steps * 90 degrees (two direction units per step).
// Diagonal values stay diagonal.
Direction rotate_direction(Direction direction, int steps);

}  // namespace furnaceline

#endif // FURNACELINE_MATH_ROTATION_HPP
