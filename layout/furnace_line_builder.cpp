#include "furnace_line_builder.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <math/rotation.hpp>
#include <sizing/furnace_sizing.hpp>

namespace furnaceline {

namespace {

constexpr double INPUT_BELT_Y = -3.0;
constexpr double OUTPUT_BELT_Y = 3.0;
constexpr double INPUT_INSERTER_Y = -2.0;
constexpr double OUTPUT_INSERTER_Y = 2.0;
constexpr double FURNACE_SPACING = 2.0;

}  // namespace

void validate_sides(Side input_side, Side output_side) {
    if (opposite(input_side) != output_side) {
        throw ValidationError(
            "Output side must be opposite the input side for the furnace line layout.");
    }
}

void apply_rotation(std::vector<Entity>& entities, int steps) {
    for (auto& entity : entities) {
        entity.position = rotate_point(entity.position, steps);
        if (entity.direction.has_value()) {
            entity.direction = rotate_direction(entity.direction.value(), steps);
        }
    }
}

void assign_entity_numbers(std::vector<Entity>& entities) {
    EntityNumber next = 1;
    for (auto& entity : entities) {
        entity.entity_number = next++;
    }
}

Blueprint FurnaceLineBuilder::from_config(const FurnaceLineConfig& config) {
    auto log = furnaceline::logging::get_logger();

    validate_sides(config.input_side, config.output_side);
    int count = calculate_furnace_count(config);
    int steps = rotation_steps_for(config.input_side);

    std::vector<Entity> entities = canonical_entities(config, count);
    apply_rotation(entities, steps);
    assign_entity_numbers(entities);

    log->debug("FurnaceLineBuilder: {} furnaces, {} entities, input {} ({} quarter turns)",
               count, entities.size(), to_string(config.input_side), steps);

    Blueprint blueprint;
    blueprint.label = config.label;
    blueprint.entities = std::move(entities);
    blueprint.icons.push_back(Icon{
        .signal_type = "item",
        .signal_name = to_string(config.furnace),
        .index = 1
    });
    blueprint.metadata = BlueprintMetadata{
        .input_side = config.input_side,
        .output_side = config.output_side,
        .belt = config.belt,
        .furnace_count = count
    };
    return blueprint;
}

std::vector<Entity> FurnaceLineBuilder::canonical_entities(const FurnaceLineConfig& config,
                                                           int count) {
    FurnaceLineBuilder builder(config, count);
    builder.add_furnaces();
    builder.add_belt_row(INPUT_BELT_Y);
    builder.add_belt_row(OUTPUT_BELT_Y);
    builder.add_inserter_row(INPUT_INSERTER_Y);
    builder.add_inserter_row(OUTPUT_INSERTER_Y);
    builder.add_coal_feed();
    return std::move(builder.entities_);
}

FurnaceLineBuilder::FurnaceLineBuilder(const FurnaceLineConfig& config, int count)
    : config_(config), count_(count) {
    entities_.reserve(static_cast<size_t>(count) * 6 + 3);
}

void FurnaceLineBuilder::add_furnaces() {
    const std::string name = to_string(config_.furnace);
    for (int i = 0; i < count_; ++i) {
        place(name, {FURNACE_SPACING * i, 0.0}, Direction::North);
    }
}

void FurnaceLineBuilder::add_belt_row(double y) {
    // One segment per tile across the full width of the furnace row
    const std::string name = to_string(config_.belt);
    for (int i = 0; i < count_ * 2; ++i) {
        place(name, {static_cast<double>(i), y}, Direction::East);
    }
}

void FurnaceLineBuilder::add_inserter_row(double y) {
    // Both rows face south: input row drops into furnaces, output row onto the belt
    for (int i = 0; i < count_; ++i) {
        place(INSERTER_NAME, {FURNACE_SPACING * i, y}, Direction::South);
    }
}

void FurnaceLineBuilder::add_coal_feed() {
    // Perpendicular feed turning onto the input belt just west of the row
    const std::string name = to_string(config_.belt);
    place(name, {-1.0, -5.0}, Direction::North);
    place(name, {-1.0, -4.0}, Direction::North);
    place(name, {-1.0, -3.0}, Direction::East);
}

void FurnaceLineBuilder::place(const std::string& name, Vec2 position, Direction direction) {
    entities_.push_back(Entity{
        .name = name,
        .position = position,
        .direction = direction,
        .entity_number = 0
    });
}

Blueprint generate_furnace_blueprint(const FurnaceLineConfig& config) {
    return FurnaceLineBuilder::from_config(config);
}

}  // namespace furnaceline
