#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Generates furnace line blueprints.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  generate    Print the blueprint exchange string (or JSON with --json)\n";
    std::cerr << "  size        Report the furnace count for a belt\n";
    std::cerr << "  list        List supported furnace and belt types\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command> --help' for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  FURNACELINE_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    } else if (command == "generate") {
        return furnaceline::cli::command_generate(argc, argv);
    } else if (command == "size") {
        return furnaceline::cli::command_size(argc, argv);
    } else if (command == "list") {
        return furnaceline::cli::command_list(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
