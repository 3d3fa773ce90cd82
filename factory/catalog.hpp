#ifndef FURNACELINE_FACTORY_CATALOG_HPP
#define FURNACELINE_FACTORY_CATALOG_HPP

#include <array>
#include <string>
#include <string_view>

namespace furnaceline {

enum class FurnaceType { Stone, Steel, Electric };

enum class BeltType { Transport, Fast, Express };

// Crafting time of one smelting recipe at speed 1.0
constexpr double SMELTING_TIME_SECONDS = 3.2;

// Entity name used for both inserter rows
constexpr const char* INSERTER_NAME = "inserter";

constexpr std::array<FurnaceType, 3> all_furnace_types() {
    return {FurnaceType::Stone, FurnaceType::Steel, FurnaceType::Electric};
}

constexpr std::array<BeltType, 3> all_belt_types() {
    return {BeltType::Transport, BeltType::Fast, BeltType::Express};
}

// Exchange-format identifiers ("stone-furnace", "fast-transport-belt", ...)
std::string to_string(FurnaceType furnace);
std::string to_string(BeltType belt);

// Throw UnknownIdentifierError for names outside the supported set
FurnaceType parse_furnace_type(std::string_view name);
BeltType parse_belt_type(std::string_view name);

// Crafting speed multiplier
double furnace_speed(FurnaceType furnace);

// Items per second carried by one full belt (both lanes)
double belt_throughput(BeltType belt);

// Items per second one furnace smelts
inline double furnace_throughput(FurnaceType furnace) {
    return furnace_speed(furnace) / SMELTING_TIME_SECONDS;
}

}  // namespace furnaceline

#endif // FURNACELINE_FACTORY_CATALOG_HPP
