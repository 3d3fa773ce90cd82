#ifndef FURNACELINE_SIZING_FURNACE_SIZING_HPP
#define FURNACELINE_SIZING_FURNACE_SIZING_HPP

#include <factory/catalog.hpp>
#include <factory/furnace_line_config.hpp>
#include <cstdint>

namespace furnaceline {

constexpr int MIN_FURNACE_COUNT = 1;
constexpr int MAX_FURNACE_COUNT = 200;

// Clamp a furnace count into [MIN_FURNACE_COUNT, MAX_FURNACE_COUNT].
// Takes a wide value so oversized inputs clamp instead of wrapping.
constexpr int clamp_length(int64_t value) {
    if (value < MIN_FURNACE_COUNT) return MIN_FURNACE_COUNT;
    if (value > MAX_FURNACE_COUNT) return MAX_FURNACE_COUNT;
    return static_cast<int>(value);
}

// Furnaces of this type needed to consume one full belt (unrounded)
double furnaces_per_full_belt(FurnaceType furnace, BeltType belt);

// Explicit config.length wins (clamped); otherwise the belt-saturating
// count rounded half away from zero, then clamped.
int calculate_furnace_count(const FurnaceLineConfig& config);

// Sizing decision with the inputs that produced it, for reporting
struct SizingReport {
    double furnace_throughput = 0.0;    // items/s per furnace
    double belt_throughput = 0.0;       // items/s per belt
    double furnaces_per_belt = 0.0;     // unrounded
    int furnace_count = 0;
    bool explicit_length = false;
};

SizingReport size_furnace_line(const FurnaceLineConfig& config);

}  // namespace furnaceline

#endif // FURNACELINE_SIZING_FURNACE_SIZING_HPP
