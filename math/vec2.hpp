#ifndef FURNACELINE_MATH_VEC2_HPP
#define FURNACELINE_MATH_VEC2_HPP

namespace furnaceline {

// Position on the blueprint grid (tile units, y grows southward)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

}  // namespace furnaceline

#endif // FURNACELINE_MATH_VEC2_HPP
