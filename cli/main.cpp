//
// Created by gregorian-rayne on 2/10/26.
//

#include "fdeps/cli/commands/command.hpp"
#include "fdeps/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << fdeps::PROJECT_NAME << " " << fdeps::VERSION_STRING
                  << " - dependency graphs for Python projects\n\n";
        std::cout << "Usage: " << fdeps::PROJECT_NAME << " <command> [OPTIONS] <target>\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : fdeps::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun '" << fdeps::PROJECT_NAME << " <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        const std::vector<std::string> args(argv + 1, argv + argc);

        if (args.empty() || args.front() == "--help" || args.front() == "-h" || args.front() == "help") {
            print_usage();
            return args.empty() ? 1 : 0;
        }

        if (args.front() == "--version" || args.front() == "-V") {
            std::cout << fdeps::PROJECT_NAME << " " << fdeps::VERSION_STRING << "\n";
            return 0;
        }

        auto* command = fdeps::cli::CommandRegistry::instance().find(args.front());
        if (!command) {
            std::cerr << "error: unknown command '" << args.front() << "'\n\n";
            print_usage();
            return 1;
        }

        const std::vector<std::string> command_args(args.begin() + 1, args.end());
        const auto parsed = fdeps::cli::parse_arguments(command_args, command->arguments());
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
