#ifndef FURNACELINE_LAYOUT_FURNACE_LINE_BUILDER_HPP
#define FURNACELINE_LAYOUT_FURNACE_LINE_BUILDER_HPP

#include <blueprint/blueprint.hpp>
#include <factory/furnace_line_config.hpp>
#include <vector>

namespace furnaceline {

// Throws ValidationError unless output_side is opposite input_side
void validate_sides(Side input_side, Side output_side);

// Rotate every entity's position, and its direction when present, in place
void apply_rotation(std::vector<Entity>& entities, int steps);

// Number entities 1..N in their current order
void assign_entity_numbers(std::vector<Entity>& entities);

// Builds a single-row furnace line.
//
// The canonical layout is laid out for input from the north and output to
// the south, then turned as a whole so north lands on config.input_side:
//
//   y = -5, -4   coal feed (x = -1)
//   y = -3       input belt   (x = 0 .. 2*count-1, flowing east)
//   y = -2       input inserters  (every furnace column)
//   y =  0       furnaces (x = 0, 2, 4, ...)
//   y = +2       output inserters
//   y = +3       output belt
class FurnaceLineBuilder {
public:
    static Blueprint from_config(const FurnaceLineConfig& config);

    // Canonical (unrotated, unnumbered) entity list for `count` furnaces
    static std::vector<Entity> canonical_entities(const FurnaceLineConfig& config, int count);

private:
    FurnaceLineBuilder(const FurnaceLineConfig& config, int count);

    void add_furnaces();
    void add_belt_row(double y);
    void add_inserter_row(double y);
    void add_coal_feed();

    void place(const std::string& name, Vec2 position, Direction direction);

    const FurnaceLineConfig& config_;
    int count_;
    std::vector<Entity> entities_;
};

// Convenience wrapper for FurnaceLineBuilder::from_config
Blueprint generate_furnace_blueprint(const FurnaceLineConfig& config);

}  // namespace furnaceline

#endif // FURNACELINE_LAYOUT_FURNACE_LINE_BUILDER_HPP
