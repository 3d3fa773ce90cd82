#include "cli_common.hpp"
#include <layout/furnace_line_builder.hpp>
#include <serialization/blueprint_json.hpp>
#include <serialization/exchange_string.hpp>
#include <common/logging.hpp>

namespace furnaceline::cli {

namespace {

void print_generate_usage() {
    std::cerr << "Usage: furnaceline generate [options] [--json]\n";
    std::cerr << "\n";
    std::cerr << "Prints a blueprint exchange string for a furnace line.\n";
    std::cerr << "  --json                 Print the blueprint document as JSON instead\n";
    print_line_options(std::cerr);
}

}  // namespace

int command_generate(int argc, char** argv) {
    auto log = furnaceline::logging::get_logger();

    try {
        CommandContext ctx = parse_command_args(argc, argv);

        if (ctx.help) {
            print_generate_usage();
            return 0;
        }

        FurnaceLineConfig config = resolve_config(ctx);
        if (ctx.config_path.has_value()) {
            log->info("Loaded configuration from: {}", ctx.config_path.value());
        }
        log->debug("Resolved configuration: {}", nlohmann::json(config).dump());

        Blueprint blueprint = generate_furnace_blueprint(config);

        if (ctx.json_output) {
            emit_output(ctx, json::to_pretty_string(blueprint_to_json(blueprint)));
        } else {
            emit_output(ctx, encode_blueprint(blueprint));
        }

        if (!ctx.output_path.empty()) {
            log->info("Wrote blueprint to {}", ctx.output_path);
            std::cerr << "Wrote " << ctx.output_path << " ("
                      << blueprint.metadata.furnace_count << " furnaces, "
                      << blueprint.entity_count() << " entities)\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace furnaceline::cli
