#include "rotation.hpp"

namespace furnaceline {

Vec2 rotate_point(const Vec2& point, int steps) {
    switch (normalize_steps(steps)) {
        case 0: return {point.x, point.y};
        case 1: return {point.y, -point.x};
        case 2: return {-point.x, -point.y};
        default: return {-point.y, point.x};
    }
}

Vec2 rotate_point(double x, double y, int steps) {
    return rotate_point(Vec2{x, y}, steps);
}

Direction rotate_direction(Direction direction, int steps) {
    return direction_from_int(to_int(direction) + normalize_steps(steps) * 2);
}

}  // namespace furnaceline
