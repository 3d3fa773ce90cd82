#include "furnace_sizing.hpp"
#include <common/logging.hpp>
#include <cmath>

namespace furnaceline {

double furnaces_per_full_belt(FurnaceType furnace, BeltType belt) {
    return belt_throughput(belt) / furnace_throughput(furnace);
}

int calculate_furnace_count(const FurnaceLineConfig& config) {
    auto log = furnaceline::logging::get_logger();

    if (config.length.has_value()) {
        int count = clamp_length(config.length.value());
        log->debug("Sizing: explicit length {} -> {} furnaces", config.length.value(), count);
        return count;
    }

    double needed = furnaces_per_full_belt(config.furnace, config.belt);
    int count = clamp_length(static_cast<int>(std::lround(needed)));
    log->debug("Sizing: {} on {} needs {:.3f} furnaces -> {}",
               to_string(config.furnace), to_string(config.belt), needed, count);
    return count;
}

SizingReport size_furnace_line(const FurnaceLineConfig& config) {
    SizingReport report;
    report.furnace_throughput = furnace_throughput(config.furnace);
    report.belt_throughput = belt_throughput(config.belt);
    report.furnaces_per_belt = furnaces_per_full_belt(config.furnace, config.belt);
    report.furnace_count = calculate_furnace_count(config);
    report.explicit_length = config.length.has_value();
    return report;
}

}  // namespace furnaceline
