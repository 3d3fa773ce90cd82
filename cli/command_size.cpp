#include "cli_common.hpp"
#include <sizing/furnace_sizing.hpp>
#include <common/logging.hpp>
#include <iomanip>
#include <sstream>

namespace furnaceline::cli {

int command_size(int argc, char** argv) {
    auto log = furnaceline::logging::get_logger();

    try {
        CommandContext ctx = parse_command_args(argc, argv);

        if (ctx.help) {
            std::cerr << "Usage: furnaceline size [options] [--json]\n";
            std::cerr << "\n";
            std::cerr << "Reports how many furnaces the line needs.\n";
            print_line_options(std::cerr);
            return 0;
        }

        FurnaceLineConfig config = resolve_config(ctx);
        SizingReport report = size_furnace_line(config);

        if (ctx.json_output) {
            nlohmann::json j = {
                {"furnace", config.furnace},
                {"belt", config.belt},
                {"furnace_throughput", report.furnace_throughput},
                {"belt_throughput", report.belt_throughput},
                {"furnaces_per_full_belt", report.furnaces_per_belt},
                {"furnace_count", report.furnace_count},
                {"explicit_length", report.explicit_length}
            };
            emit_output(ctx, json::to_pretty_string(j));
            return 0;
        }

        std::ostringstream out;
        out << std::fixed << std::setprecision(4);
        out << "furnace:                " << to_string(config.furnace)
            << " (" << report.furnace_throughput << " items/s)\n";
        out << "belt:                   " << to_string(config.belt)
            << " (" << report.belt_throughput << " items/s)\n";
        out << "furnaces per full belt: " << report.furnaces_per_belt << "\n";
        out << "furnace count:          " << report.furnace_count
            << (report.explicit_length ? " (explicit length)" : " (saturates belt)");
        emit_output(ctx, out.str());

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace furnaceline::cli
