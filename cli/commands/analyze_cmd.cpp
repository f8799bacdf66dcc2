//
// Created by gregorian-rayne on 2/10/26.
//

#include "fdeps/cli/commands/command.hpp"
#include "fdeps/cli/commands/analysis_args.hpp"

#include "fdeps/fdeps.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace fdeps::cli
{
    /**
     * Analyze command - builds the dependency graph of a file or directory.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Analyze the import dependencies of a Python file or project";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: fastdeps analyze [OPTIONS] <target>\n"
                   "\n"
                   "Examples:\n"
                   "  fastdeps analyze src/\n"
                   "  fastdeps analyze --internal-only -o deps.dot mypackage/\n"
                   "  fastdeps analyze --json --ignore 'tests,**/migrations' .";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            std::vector<ArgDef> args = {
                {"output", 'o', "Write the report to FILE; .json/.dot/.txt select the format", false, true, "", "FILE"},
                {"format", 'f', "Report format: text, json or dot (default: text)", false, true, "", "FORMAT"},
                {"show-external", 0, "Include external modules in the report", false, false, "", ""},
                {"show-cycles", 0, "Print circular dependencies after the report", false, false, "", ""},
            };
            for (auto& def : analysis_arguments()) {
                args.push_back(std::move(def));
            }
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No target specified. Use 'fastdeps analyze <path>'";
            }
            if (args.positional().size() > 1) {
                return "Only one target can be analyzed at a time";
            }
            if (const auto format = args.get("format"); format && !report::report_format_from_string(*format)) {
                return "Unknown format: " + *format + " (expected text, json or dot)";
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
            const auto output = args.get("output");
            const auto format = select_format(args, output);

            if (const auto file = config_file_for(args, target)) {
                print_verbose("Using configuration " + file->string());
            }

            auto config = build_config(args, target);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            print_debug("Workers: " + std::to_string(config.value().workers) +
                        ", excluded directories: " + std::to_string(config.value().exclude_dirs.size()) +
                        ", ignore patterns: " + std::to_string(config.value().ignore_patterns.size()));

            const analysis::DependencyAnalyzer analyzer(config.value());
            auto result = analyzer.analyze(target);
            if (result.is_err()) {
                print_error(result.error().to_string());
                return 1;
            }

            const auto& analysis = result.value();
            report_summary(analysis);

            const bool show_external = args.get_flag("show-external");
            if (output) {
                if (auto written = report::write_report(*output, analysis.graph, format, show_external);
                    written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print("Wrote " + std::string(report::to_string(format)) + " report to " + *output);
            } else {
                std::cout << report::render(analysis.graph, format, show_external);
            }

            if (args.get_flag("show-cycles")) {
                std::cout << report::cycles_to_text(analysis.graph, graph::find_cycles(analysis.graph));
            }

            return 0;
        }

    private:
        static report::ReportFormat select_format(const ParsedArgs& args, const std::optional<std::string>& output) {
            if (args.get_flag("json")) {
                return report::ReportFormat::Json;
            }
            if (const auto format = args.get("format")) {
                return report::report_format_from_string(*format).value_or(report::ReportFormat::Text);
            }
            if (output) {
                return report::report_format_from_extension(*output).value_or(report::ReportFormat::Text);
            }
            return report::ReportFormat::Text;
        }

        void report_summary(const analysis::AnalysisResult& analysis) const {
            const auto& summary = analysis.summary;

            print_verbose("Found " + std::to_string(summary.files_found) + " Python files to analyze");
            print_verbose("Extracted imports from " + std::to_string(summary.files_extracted) + " files" +
                          (summary.chunks_dispatched > 0
                               ? " in " + std::to_string(summary.chunks_dispatched) + " chunks"
                               : ""));

            if (summary.degraded_files > 0) {
                print_warning(std::to_string(summary.degraded_files) +
                              " files could not be parsed and were treated as having no imports");
            }

            std::ostringstream elapsed;
            elapsed << std::fixed << std::setprecision(2)
                    << static_cast<double>(summary.elapsed.count()) / 1000.0;
            print_verbose("Analysis complete in " + elapsed.str() + " seconds");

            if (verbosity() >= Verbosity::Debug) {
                for (const auto& [path, node] : analysis.graph.nodes()) {
                    print_debug(analysis.graph.relative_path(path).generic_string() + ": " +
                                std::to_string(node.imports.size()) + " internal, " +
                                std::to_string(node.external_imports.size()) + " external");
                }
            }
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace fdeps::cli
