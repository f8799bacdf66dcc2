//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef FDEPS_ANALYSIS_ARGS_HPP
#define FDEPS_ANALYSIS_ARGS_HPP

/**
 * @file analysis_args.hpp
 * @brief Options shared by every command that runs an analysis.
 */

#include "fdeps/cli/commands/command.hpp"
#include "fdeps/config.hpp"

#include <vector>

namespace fdeps::cli
{
    /**
     * Argument definitions for target selection, filtering and parallelism.
     */
    [[nodiscard]] std::vector<ArgDef> analysis_arguments();

    /**
     * Returns the configuration file to load for target, if any: the
     * --config value, otherwise the project file in the target directory
     * when it exists.
     */
    [[nodiscard]] std::optional<fs::path> config_file_for(const ParsedArgs& args, const fs::path& target);

    /**
     * Builds the analyzer configuration for target.
     *
     * Starts from the configuration file (see config_file_for) or the
     * defaults, then applies command-line overrides: -j, --internal-only,
     * --exclude (added to the excluded directories) and --ignore (added to
     * the ignore patterns).
     *
     * @return NotFound for a missing --config file, ParseError or
     *         ConfigError for an invalid one, InvalidArgument for a bad -j.
     */
    [[nodiscard]] Result<AnalyzerConfig, Error> build_config(const ParsedArgs& args, const fs::path& target);

}  // namespace fdeps::cli

#endif //FDEPS_ANALYSIS_ARGS_HPP
