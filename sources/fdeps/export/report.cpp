//
// Created by gregorian-rayne on 2/9/26.
//

#include "fdeps/export/report.hpp"
#include "fdeps/utils/file_utils.hpp"
#include "fdeps/utils/string_utils.hpp"

#include <ranges>
#include <set>
#include <sstream>

namespace fdeps::report {

    using json = nlohmann::json;

    namespace {

    constexpr std::size_t HEAVILY_IMPORTED = 3;

    std::string display_path(const graph::DependencyGraph& graph, const fs::path& path) {
        return graph.relative_path(path).generic_string();
    }

    std::string dot_escape(const std::string_view value) {
        std::string out;
        out.reserve(value.size());
        for (const char c : value) {
            if (c == '"' || c == '\\') {
                out += '\\';
            }
            out += c;
        }
        return out;
    }

    std::string dot_label(const std::string& path) {
        std::string label;
        for (const char c : dot_escape(path)) {
            if (c == '/') {
                label += "\\n";
            } else {
                label += c;
            }
        }
        return label;
    }

    std::string external_node_id(const std::string& module) {
        std::string id = "ext_";
        for (const char c : module) {
            id += string_utils::is_identifier_char(c) ? c : '_';
        }
        return id;
    }

    std::string_view node_color(const graph::GraphNode& node) {
        if (!node.imported_by.empty() && node.imports.empty()) {
            return "lightgreen";
        }
        if (!node.imports.empty() && node.imported_by.empty()) {
            return "lightblue";
        }
        if (node.imported_by.size() > HEAVILY_IMPORTED) {
            return "yellow";
        }
        return "white";
    }

    json ranked_to_json(const graph::DependencyGraph& graph, const std::vector<graph::RankedFile>& ranked) {
        json array = json::array();
        for (const auto& [path, count] : ranked) {
            array.push_back({{"file", display_path(graph, path)}, {"count", count}});
        }
        return array;
    }

    void write_ranking(std::ostringstream& ss,
                       const graph::DependencyGraph& graph,
                       const std::string_view title,
                       const std::vector<graph::RankedFile>& ranked) {
        if (ranked.empty()) {
            return;
        }
        ss << title << ":\n";
        for (const auto& [path, count] : ranked) {
            ss << "  " << display_path(graph, path) << ": " << count << " imports\n";
        }
        ss << "\n";
    }

    }  // namespace

    std::string_view to_string(const ReportFormat format) noexcept {
        switch (format) {
            case ReportFormat::Text: return "text";
            case ReportFormat::Json: return "json";
            case ReportFormat::Dot: return "dot";
        }
        return "unknown";
    }

    std::optional<ReportFormat> report_format_from_string(const std::string_view name) {
        const auto lower = string_utils::to_lower(name);
        if (lower == "text" || lower == "txt") return ReportFormat::Text;
        if (lower == "json") return ReportFormat::Json;
        if (lower == "dot" || lower == "graphviz") return ReportFormat::Dot;
        return std::nullopt;
    }

    std::optional<ReportFormat> report_format_from_extension(const fs::path& path) {
        const auto ext = string_utils::to_lower(path.extension().string());
        if (ext == ".json") return ReportFormat::Json;
        if (ext == ".dot" || ext == ".gv") return ReportFormat::Dot;
        if (ext == ".txt") return ReportFormat::Text;
        return std::nullopt;
    }

    json to_json(const graph::DependencyGraph& graph) {
        json nodes = json::object();
        json edges = json::array();
        json external = json::object();

        for (const auto& [path, node] : graph.nodes()) {
            const auto from = display_path(graph, path);

            nodes[from] = {
                {"imports_count", node.imports.size()},
                {"imported_by_count", node.imported_by.size()},
                {"external_count", node.external_imports.size()}
            };

            for (const auto& target : node.imports) {
                edges.push_back({{"from", from}, {"to", display_path(graph, target)}});
            }

            if (!node.external_imports.empty()) {
                external[from] = node.external_imports;
            }
        }

        const auto stats = graph::compute_stats(graph);

        json cycles_json = json::array();
        for (const auto& cycle : stats.cycle_list) {
            json members = json::array();
            for (const auto& file : cycle.files) {
                members.push_back(display_path(graph, file));
            }
            cycles_json.push_back(std::move(members));
        }

        json report;
        report["nodes"] = std::move(nodes);
        report["edges"] = std::move(edges);
        report["external"] = std::move(external);
        report["stats"] = {
            {"total_files", stats.total_files},
            {"total_dependencies", stats.total_dependencies},
            {"total_external", stats.total_external},
            {"cycles", stats.cycles},
            {"most_imported", ranked_to_json(graph, stats.most_imported)},
            {"most_imports", ranked_to_json(graph, stats.most_imports)}
        };
        report["cycles"] = std::move(cycles_json);
        return report;
    }

    std::string to_text(const graph::DependencyGraph& graph, const bool show_external) {
        std::ostringstream ss;
        const auto stats = graph::compute_stats(graph);

        ss << "Dependency Analysis Report\n";
        ss << std::string(50, '=') << "\n\n";

        ss << "Files analyzed: " << stats.total_files << "\n";
        ss << "Internal dependencies: " << stats.total_dependencies << "\n";
        ss << "External dependencies: " << stats.total_external << "\n";
        ss << "Circular dependencies: " << stats.cycles << "\n\n";

        write_ranking(ss, graph, "Most imported files", stats.most_imported);
        write_ranking(ss, graph, "Files with most imports", stats.most_imports);

        if (show_external) {
            std::set<std::string> modules;
            for (const auto& node : graph.nodes() | std::views::values) {
                modules.insert(node.external_imports.begin(), node.external_imports.end());
            }
            if (!modules.empty()) {
                ss << "External modules:\n";
                for (const auto& module : modules) {
                    ss << "  " << module << "\n";
                }
                ss << "\n";
            }
        }

        if (stats.cycles > 0) {
            ss << cycles_to_text(graph, stats.cycle_list);
        }

        return ss.str();
    }

    std::string to_dot(const graph::DependencyGraph& graph, const bool show_external) {
        std::ostringstream ss;

        ss << "digraph dependencies {\n";
        ss << "    rankdir=\"LR\";\n";
        ss << "    node [shape=box];\n\n";

        for (const auto& [path, node] : graph.nodes()) {
            const auto name = display_path(graph, path);
            ss << "    \"" << dot_escape(name) << "\" [label=\"" << dot_label(name)
               << "\", fillcolor=\"" << node_color(node) << "\", style=filled];\n";
        }
        ss << "\n";

        for (const auto& [path, node] : graph.nodes()) {
            const auto from = dot_escape(display_path(graph, path));
            for (const auto& target : node.imports) {
                ss << "    \"" << from << "\" -> \"" << dot_escape(display_path(graph, target)) << "\";\n";
            }
        }

        if (show_external) {
            ss << "\n    // External dependencies\n";

            std::set<std::string> declared;
            for (const auto& [path, node] : graph.nodes()) {
                const auto from = dot_escape(display_path(graph, path));
                for (const auto& module : node.external_imports) {
                    const auto id = external_node_id(module);
                    if (declared.insert(id).second) {
                        ss << "    " << id << " [label=\"" << dot_escape(module)
                           << "\", shape=ellipse, style=dashed];\n";
                    }
                    ss << "    \"" << from << "\" -> " << id << " [style=dashed];\n";
                }
            }
        }

        ss << "}\n";
        return ss.str();
    }

    std::string cycles_to_text(const graph::DependencyGraph& graph, const std::vector<graph::Cycle>& cycles) {
        if (cycles.empty()) {
            return "No circular dependencies found.\n";
        }

        std::ostringstream ss;
        ss << "Circular dependencies detected: " << cycles.size() << "\n";
        for (std::size_t i = 0; i < cycles.size(); ++i) {
            ss << "  Cycle " << (i + 1) << ":\n";
            for (const auto& file : cycles[i].files) {
                ss << "    -> " << display_path(graph, file) << "\n";
            }
        }
        ss << "\n";
        return ss.str();
    }

    std::string render(const graph::DependencyGraph& graph, const ReportFormat format, const bool show_external) {
        switch (format) {
            case ReportFormat::Json: return to_json(graph).dump(2, ' ', false, json::error_handler_t::replace) + "\n";
            case ReportFormat::Dot: return to_dot(graph, show_external);
            case ReportFormat::Text: break;
        }
        return to_text(graph, show_external);
    }

    Result<void, Error> write_report(const fs::path& path,
                                     const graph::DependencyGraph& graph,
                                     const ReportFormat format,
                                     const bool show_external) {
        return file_utils::write_file(path, render(graph, format, show_external));
    }

}  // namespace fdeps::report
