#ifndef FURNACELINE_CLI_COMMON_HPP
#define FURNACELINE_CLI_COMMON_HPP

#include <common/logging.hpp>
#include <factory/furnace_line_config.hpp>
#include <sizing/furnace_sizing.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace furnaceline::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool json_output = false;
    bool help = false;

    // Furnace line overrides (applied on top of the config file)
    std::optional<std::string> furnace;
    std::optional<std::string> belt;
    std::optional<int> length;
    std::optional<std::string> input_side;
    std::optional<std::string> output_side;
    std::optional<std::string> label;
};

// Parse a furnace count option. Any integer is accepted and clamped to the
// supported range, including values too large for 64 bits.
inline int parse_length_option(const std::string& option, const std::string& value) {
    size_t consumed = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &consumed);
    } catch (const std::out_of_range&) {
        // Beyond 64 bits: still has to be a plain integer, then the sign decides
        size_t pos = value.find_first_not_of(" \t");
        bool negative = value[pos] == '-';
        if (value[pos] == '-' || value[pos] == '+') {
            ++pos;
        }
        if (value.find_first_not_of("0123456789", pos) != std::string::npos) {
            throw std::runtime_error(option + " requires an integer (got '" + value + "')");
        }
        return negative ? MIN_FURNACE_COUNT : MAX_FURNACE_COUNT;
    } catch (const std::invalid_argument&) {
        throw std::runtime_error(option + " requires an integer (got '" + value + "')");
    }
    if (consumed != value.size()) {
        throw std::runtime_error(option + " requires an integer (got '" + value + "')");
    }
    return clamp_length(static_cast<int64_t>(result));
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto take_value = [&](const std::string& option) -> std::string {
        if (i + 1 < argc) {
            std::string value = argv[i + 1];
            i += 2;
            return value;
        }
        throw std::runtime_error(option + " requires an argument");
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "--json") {
            ctx.json_output = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = take_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = take_value("-c/--config");
        } else if (arg == "--furnace") {
            ctx.furnace = take_value(arg);
        } else if (arg == "--belt") {
            ctx.belt = take_value(arg);
        } else if (arg == "--length") {
            ctx.length = parse_length_option(arg, take_value(arg));
        } else if (arg == "--input-side") {
            ctx.input_side = take_value(arg);
        } else if (arg == "--output-side") {
            ctx.output_side = take_value(arg);
        } else if (arg == "--label") {
            ctx.label = take_value(arg);
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            throw std::runtime_error("Unexpected positional argument: " + arg);
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Parse the arguments following "furnaceline <command>" and apply -v
inline CommandContext parse_command_args(int argc, char** argv) {
    auto [ctx, _] = parse_common_args(argc, argv, 2);
    if (ctx.verbose) {
        logging::raise_verbosity(spdlog::level::debug);
    }
    return ctx;
}

// Build the furnace line configuration: defaults, then the config file,
// then command-line flags. Unknown identifiers throw UnknownIdentifierError.
inline FurnaceLineConfig resolve_config(const CommandContext& ctx) {
    FurnaceLineConfig config;

    if (ctx.config_path.has_value()) {
        config = json::read_json_file(ctx.config_path.value()).get<FurnaceLineConfig>();
    }

    if (ctx.furnace) config.furnace = parse_furnace_type(*ctx.furnace);
    if (ctx.belt) config.belt = parse_belt_type(*ctx.belt);
    if (ctx.length) config.length = *ctx.length;
    if (ctx.input_side) config.input_side = parse_side(*ctx.input_side);
    if (ctx.output_side) config.output_side = parse_side(*ctx.output_side);
    if (ctx.label) config.label = *ctx.label;

    return config;
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Send output to stdout, or to ctx.output_path when one was given
inline void emit_output(const CommandContext& ctx, const std::string& content) {
    if (ctx.output_path.empty()) {
        std::cout << content << "\n";
    } else {
        write_file(ctx.output_path, content + "\n");
    }
}

// Options shared by generate and size
inline void print_line_options(std::ostream& out) {
    out << "Options:\n";
    out << "  --furnace <type>       stone-furnace | steel-furnace | electric-furnace\n";
    out << "  --belt <type>          transport-belt | fast-transport-belt | express-transport-belt\n";
    out << "  --length <n>           Explicit furnace count (clamped to 1-200)\n";
    out << "  --input-side <side>    north | east | south | west (default north)\n";
    out << "  --output-side <side>   Must be opposite the input side (default south)\n";
    out << "  --label <text>         Blueprint label (default \"Furnace line\")\n";
    out << "  -c, --config <file>    JSON file with any of the settings above\n";
    out << "  -o, --output <file>    Write to file instead of stdout\n";
    out << "  -v, --verbose          Debug logging\n";
}

// Command function declarations
int command_generate(int argc, char** argv);
int command_size(int argc, char** argv);
int command_list(int argc, char** argv);

}  // namespace furnaceline::cli

#endif // FURNACELINE_CLI_COMMON_HPP
