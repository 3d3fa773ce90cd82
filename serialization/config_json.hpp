#ifndef FURNACELINE_SERIALIZATION_CONFIG_JSON_HPP
#define FURNACELINE_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <factory/furnace_line_config.hpp>
#include <serialization/enum_json.hpp>
#include <sizing/furnace_sizing.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace furnaceline {

// FurnaceLineConfig serialization
inline void to_json(nlohmann::json& j, const FurnaceLineConfig& config) {
    j = {
        {"furnace", config.furnace},
        {"belt", config.belt},
        {"input_side", config.input_side},
        {"output_side", config.output_side},
        {"label", config.label}
    };
    if (config.length.has_value()) {
        j["length"] = config.length.value();
    } else {
        j["length"] = nullptr;
    }
}

// Config-file furnace count: any JSON integer, clamped to the supported range
inline int length_from_json(const nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        uint64_t value = j.get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return MAX_FURNACE_COUNT;
        }
        return clamp_length(static_cast<int64_t>(value));
    }
    if (j.is_number_integer()) {
        return clamp_length(j.get<int64_t>());
    }
    throw std::runtime_error("length must be an integer (got " + j.dump() + ")");
}

// Missing keys keep their defaults; unknown identifiers throw
inline void from_json(const nlohmann::json& j, FurnaceLineConfig& config) {
    const FurnaceLineConfig defaults;
    config.furnace = j.value("furnace", defaults.furnace);
    config.belt = j.value("belt", defaults.belt);
    if (j.contains("length") && !j.at("length").is_null()) {
        config.length = length_from_json(j.at("length"));
    } else {
        config.length = std::nullopt;
    }
    config.input_side = j.value("input_side", defaults.input_side);
    config.output_side = j.value("output_side", defaults.output_side);
    config.label = j.value("label", defaults.label);
}

}  // namespace furnaceline

#endif // FURNACELINE_SERIALIZATION_CONFIG_JSON_HPP
