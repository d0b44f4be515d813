//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/cli/commands/command.hpp"
#include "cga/utils/logging.hpp"
#include "cga/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << cga::PROJECT_NAME << " " << cga::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << cga::PROJECT_SHORT_NAME << " <command> [OPTIONS] <relations.json>\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : cga::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun '" << cga::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        cga::logging::init();

        if (argc < 2) {
            print_usage();
            return 1;
        }

        const std::string command_name = argv[1];
        if (command_name == "--help" || command_name == "-h" || command_name == "help") {
            print_usage();
            return 0;
        }
        if (command_name == "--version" || command_name == "version") {
            std::cout << cga::PROJECT_SHORT_NAME << " " << cga::VERSION_STRING << "\n";
            return 0;
        }

        auto* command = cga::cli::CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            std::cerr << "error: unknown command '" << command_name << "'\n\n";
            print_usage();
            return 1;
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        const auto parsed = cga::cli::parse_arguments(args, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 1;
        }

        if (!parsed.args.get_flag("help")) {
            if (const auto problem = command->validate(parsed.args); !problem.empty()) {
                std::cerr << "error: " << problem << "\n\n" << command->usage() << "\n";
                return 1;
            }
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
