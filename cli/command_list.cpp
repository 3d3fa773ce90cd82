#include "cli_common.hpp"
#include <factory/catalog.hpp>
#include <common/logging.hpp>
#include <sstream>

namespace furnaceline::cli {

int command_list(int argc, char** argv) {
    auto log = furnaceline::logging::get_logger();

    try {
        CommandContext ctx = parse_command_args(argc, argv);

        if (ctx.help) {
            std::cerr << "Usage: furnaceline list [--json] [-o <file>]\n";
            return 0;
        }

        if (ctx.json_output) {
            nlohmann::json j = {
                {"furnaces", nlohmann::json::object()},
                {"belts", nlohmann::json::object()}
            };
            for (FurnaceType furnace : all_furnace_types()) {
                j["furnaces"][to_string(furnace)] = furnace_speed(furnace);
            }
            for (BeltType belt : all_belt_types()) {
                j["belts"][to_string(belt)] = belt_throughput(belt);
            }
            emit_output(ctx, json::to_pretty_string(j));
            return 0;
        }

        std::ostringstream out;
        out << "Furnaces (crafting speed):\n";
        for (FurnaceType furnace : all_furnace_types()) {
            out << "  " << to_string(furnace) << "  " << furnace_speed(furnace) << "\n";
        }
        out << "Belts (items/s):\n";
        for (BeltType belt : all_belt_types()) {
            out << "  " << to_string(belt) << "  " << belt_throughput(belt) << "\n";
        }
        std::string text = out.str();
        text.pop_back();
        emit_output(ctx, text);

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace furnaceline::cli
