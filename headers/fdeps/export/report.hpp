//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef FDEPS_REPORT_HPP
#define FDEPS_REPORT_HPP

/**
 * @file report.hpp
 * @brief Rendering of a finished dependency graph.
 *
 * Formats:
 * - Text: summary, rankings and cycles for terminal output
 * - JSON: nodes, edges, external modules, statistics and cycles
 * - DOT: Graphviz digraph, optionally with external modules
 *
 * Paths are written relative to the graph root with '/' separators.
 */

#include "fdeps/result.hpp"
#include "fdeps/error.hpp"
#include "fdeps/graph/dependency_graph.hpp"
#include "fdeps/graph/graph_algorithms.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fdeps::report {

    enum class ReportFormat {
        Text,
        Json,
        Dot
    };

    [[nodiscard]] std::string_view to_string(ReportFormat format) noexcept;

    /**
     * Parses "text", "json" or "dot" (case-insensitive).
     */
    [[nodiscard]] std::optional<ReportFormat> report_format_from_string(std::string_view name);

    /**
     * Picks a format from an output file suffix (.txt, .json, .dot, .gv).
     */
    [[nodiscard]] std::optional<ReportFormat> report_format_from_extension(const fs::path& path);

    [[nodiscard]] nlohmann::json to_json(const graph::DependencyGraph& graph);

    /**
     * Renders the human-readable report. With show_external the distinct
     * external module names are listed as well.
     */
    [[nodiscard]] std::string to_text(const graph::DependencyGraph& graph, bool show_external = false);

    /**
     * Renders a Graphviz digraph.
     *
     * Files imported by others but importing nothing are light green, files
     * nobody imports are light blue, files with more than three dependents
     * are yellow. External modules become dashed ellipses when requested.
     */
    [[nodiscard]] std::string to_dot(const graph::DependencyGraph& graph, bool show_external = false);

    /**
     * Lists cycles one file per line, or a single line when there are none.
     */
    [[nodiscard]] std::string cycles_to_text(
        const graph::DependencyGraph& graph,
        const std::vector<graph::Cycle>& cycles
    );

    /**
     * Renders in the given format.
     */
    [[nodiscard]] std::string render(
        const graph::DependencyGraph& graph,
        ReportFormat format,
        bool show_external = false
    );

    /**
     * Renders and writes to path.
     */
    [[nodiscard]] Result<void, Error> write_report(
        const fs::path& path,
        const graph::DependencyGraph& graph,
        ReportFormat format,
        bool show_external = false
    );

}  // namespace fdeps::report

#endif //FDEPS_REPORT_HPP
