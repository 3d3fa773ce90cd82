#include "catalog.hpp"
#include <common/errors.hpp>

namespace furnaceline {

namespace {

template <typename Enum, size_t N>
std::string accepted_names(const std::array<Enum, N>& values) {
    std::string result;
    for (size_t i = 0; i < N; ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += to_string(values[i]);
    }
    return result;
}

}  // namespace

std::string to_string(FurnaceType furnace) {
    switch (furnace) {
        case FurnaceType::Stone: return "stone-furnace";
        case FurnaceType::Steel: return "steel-furnace";
        case FurnaceType::Electric: return "electric-furnace";
    }
    throw UnknownIdentifierError("furnace type",
                                 std::to_string(static_cast<int>(furnace)),
                                 accepted_names(all_furnace_types()));
}

std::string to_string(BeltType belt) {
    switch (belt) {
        case BeltType::Transport: return "transport-belt";
        case BeltType::Fast: return "fast-transport-belt";
        case BeltType::Express: return "express-transport-belt";
    }
    throw UnknownIdentifierError("belt type",
                                 std::to_string(static_cast<int>(belt)),
                                 accepted_names(all_belt_types()));
}

FurnaceType parse_furnace_type(std::string_view name) {
    for (FurnaceType furnace : all_furnace_types()) {
        if (name == to_string(furnace)) {
            return furnace;
        }
    }
    throw UnknownIdentifierError("furnace type", std::string(name),
                                 accepted_names(all_furnace_types()));
}

BeltType parse_belt_type(std::string_view name) {
    for (BeltType belt : all_belt_types()) {
        if (name == to_string(belt)) {
            return belt;
        }
    }
    throw UnknownIdentifierError("belt type", std::string(name),
                                 accepted_names(all_belt_types()));
}

double furnace_speed(FurnaceType furnace) {
    switch (furnace) {
        case FurnaceType::Stone: return 1.0;
        case FurnaceType::Steel: return 2.0;
        case FurnaceType::Electric: return 2.0;
    }
    throw UnknownIdentifierError("furnace type",
                                 std::to_string(static_cast<int>(furnace)),
                                 accepted_names(all_furnace_types()));
}

double belt_throughput(BeltType belt) {
    switch (belt) {
        case BeltType::Transport: return 15.0;
        case BeltType::Fast: return 30.0;
        case BeltType::Express: return 45.0;
    }
    throw UnknownIdentifierError("belt type",
                                 std::to_string(static_cast<int>(belt)),
                                 accepted_names(all_belt_types()));
}

}  // namespace furnaceline
