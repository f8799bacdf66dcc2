//
// Created by gregorian-rayne on 2/7/26.
//

#ifndef FDEPS_CONFIG_HPP
#define FDEPS_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Analyzer settings and their TOML representation.
 *
 * Example file:
 * @code
 * [analysis]
 * workers = 8
 * internal_only = false
 *
 * [filters]
 * extra_exclude_dirs = ["build", "dist"]
 * ignore_patterns = ["test_*.py", "migrations"]
 *
 * [extraction]
 * initial_window_bytes = 10240
 * chunk_timeout_ms = 30000
 * @endcode
 */

#include "fdeps/result.hpp"
#include "fdeps/error.hpp"
#include "fdeps/types.hpp"
#include "fdeps/scanner/source_scanner.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace fdeps {

    /// Upper bound accepted for the worker count.
    inline constexpr int MAX_WORKERS = 1024;

    struct AnalyzerConfig {
        /// Extraction workers; 0 selects the hardware concurrency.
        int workers = 0;

        /// Drop external module names from the graph.
        bool internal_only = false;

        /// Directory names never descended into.
        std::set<std::string> exclude_dirs = scanner::default_exclude_dirs();

        /// Globs for files and directories to skip.
        std::vector<std::string> ignore_patterns;

        std::int64_t initial_window_bytes = 10240;

        std::chrono::milliseconds chunk_timeout{30000};

        /**
         * Loads settings from a TOML file.
         *
         * @return NotFound if the file is missing, ParseError for invalid
         *         TOML, ConfigError for out-of-range values.
         */
        [[nodiscard]] static Result<AnalyzerConfig, Error> load_from_file(const fs::path& path);

        [[nodiscard]] static Result<AnalyzerConfig, Error> load_from_string(const std::string& content);

        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Serializes to TOML that load_from_string() reads back.
         */
        [[nodiscard]] std::string to_string() const;
    };

}  // namespace fdeps

#endif //FDEPS_CONFIG_HPP
