#ifndef FURNACELINE_SERIALIZATION_BLUEPRINT_JSON_HPP
#define FURNACELINE_SERIALIZATION_BLUEPRINT_JSON_HPP

#include <nlohmann/json.hpp>
#include <blueprint/blueprint.hpp>
#include <serialization/enum_json.hpp>

namespace furnaceline {

// Blueprint documents use insertion-ordered objects so keys come out in
// the order the exchange format declares them.

inline void to_json(nlohmann::ordered_json& j, const Vec2& v) {
    j = nlohmann::ordered_json{
        {"x", v.x},
        {"y", v.y}
    };
}

inline void to_json(nlohmann::ordered_json& j, const Entity& entity) {
    j = nlohmann::ordered_json::object();
    j["name"] = entity.name;
    j["position"] = entity.position;
    if (entity.direction.has_value()) {
        j["direction"] = entity.direction.value();
    }
    j["entity_number"] = entity.entity_number;
}

inline void to_json(nlohmann::ordered_json& j, const Icon& icon) {
    j = nlohmann::ordered_json{
        {"signal", {
            {"type", icon.signal_type},
            {"name", icon.signal_name}
        }},
        {"index", icon.index}
    };
}

inline void to_json(nlohmann::ordered_json& j, const BlueprintMetadata& metadata) {
    j = nlohmann::ordered_json{
        {"input_side", metadata.input_side},
        {"output_side", metadata.output_side},
        {"belt", metadata.belt},
        {"furnace_count", metadata.furnace_count}
    };
}

// Full exchange document: {"blueprint": {...}}
inline nlohmann::ordered_json blueprint_to_json(const Blueprint& blueprint) {
    nlohmann::ordered_json body = nlohmann::ordered_json::object();
    body["label"] = blueprint.label;
    body["item"] = Blueprint::ITEM;
    body["version"] = Blueprint::VERSION;
    body["entities"] = blueprint.entities;
    body["icons"] = blueprint.icons;
    body["metadata"] = blueprint.metadata;

    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["blueprint"] = std::move(body);
    return j;
}

}  // namespace furnaceline

#endif // FURNACELINE_SERIALIZATION_BLUEPRINT_JSON_HPP
