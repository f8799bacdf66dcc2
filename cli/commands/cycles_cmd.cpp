//
// Created by gregorian-rayne on 2/10/26.
//

#include "fdeps/cli/commands/command.hpp"
#include "fdeps/cli/commands/analysis_args.hpp"

#include "fdeps/fdeps.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace fdeps::cli
{
    /**
     * Cycles command - lists circular dependencies, optionally failing on them.
     */
    class CyclesCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "cycles";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List circular import dependencies";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: fastdeps cycles [OPTIONS] <target>\n"
                   "\n"
                   "Examples:\n"
                   "  fastdeps cycles src/\n"
                   "  fastdeps cycles --fail-on-cycles --json .";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            std::vector<ArgDef> args = {
                {"fail-on-cycles", 0, "Exit with status 1 when cycles exist", false, false, "", ""},
            };
            for (auto& def : analysis_arguments()) {
                args.push_back(std::move(def));
            }
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one target. Use 'fastdeps cycles <path>'";
            }
            return Command::validate(args);
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_verbosity(args);

            const fs::path target(args.positional().front());

            auto config = build_config(args, target);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }
            // Cycles only involve project files.
            config.value().internal_only = true;

            const analysis::DependencyAnalyzer analyzer(config.value());
            auto result = analyzer.analyze(target);
            if (result.is_err()) {
                print_error(result.error().to_string());
                return 1;
            }

            const auto& graph = result.value().graph;
            const auto cycles = graph::find_cycles(graph);

            print_verbose("Checked " + std::to_string(graph.node_count()) + " files");

            if (args.get_flag("json")) {
                nlohmann::json out = nlohmann::json::array();
                for (const auto& cycle : cycles) {
                    nlohmann::json members = nlohmann::json::array();
                    for (const auto& file : cycle.files) {
                        members.push_back(graph.relative_path(file).generic_string());
                    }
                    out.push_back(std::move(members));
                }
                std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            } else {
                std::cout << report::cycles_to_text(graph, cycles);
            }

            if (!cycles.empty() && args.get_flag("fail-on-cycles")) {
                print_error(std::to_string(cycles.size()) + " circular dependencies found");
                return 1;
            }
            return 0;
        }
    };

    namespace {
        struct CyclesCommandRegistrar {
            CyclesCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<CyclesCommand>()
                );
            }
        } cycles_registrar;
    }
}  // namespace fdeps::cli
