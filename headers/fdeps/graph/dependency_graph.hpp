//
// Created by gregorian-rayne on 2/6/26.
//

#ifndef FDEPS_DEPENDENCY_GRAPH_HPP
#define FDEPS_DEPENDENCY_GRAPH_HPP

/**
 * @file dependency_graph.hpp
 * @brief File-level import graph of one analysis run.
 *
 * Nodes are source files keyed by path. Each node keeps its resolved
 * internal targets, the mirrored set of files importing it, and the
 * external module names it references. All containers are ordered so that
 * traversal and reports are deterministic.
 */

#include "fdeps/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace fdeps::graph {

    struct GraphNode {
        fs::path path;

        /// Files this file imports (out-edges).
        std::set<fs::path> imports;

        /// Files importing this file (in-edges).
        std::set<fs::path> imported_by;

        /// Module names that did not resolve to a project file.
        std::set<std::string> external_imports;

        [[nodiscard]] bool is_leaf() const noexcept {
            return imports.empty();
        }

        [[nodiscard]] bool is_root() const noexcept {
            return imported_by.empty();
        }
    };

    /**
     * Directed import graph. Not thread-safe; built by a single thread.
     *
     * Adding a node or edge that already exists has no effect. A file that
     * imports itself gets a self-edge, which cycle detection ignores.
     */
    class DependencyGraph {
    public:
        DependencyGraph() = default;

        /**
         * Ensures a node exists for path.
         */
        GraphNode& add_file(const fs::path& path);

        /**
         * Adds the edge from -> to, creating either node on first reference.
         */
        void add_dependency(const fs::path& from, const fs::path& to);

        /**
         * Records an unresolved module name referenced by from.
         */
        void add_external(const fs::path& from, const std::string& module);

        [[nodiscard]] bool has_file(const fs::path& path) const {
            return nodes_.contains(path);
        }

        [[nodiscard]] bool has_dependency(const fs::path& from, const fs::path& to) const;

        /**
         * Returns the node for path, or nullptr when absent.
         */
        [[nodiscard]] const GraphNode* node(const fs::path& path) const;

        [[nodiscard]] const std::map<fs::path, GraphNode>& nodes() const noexcept {
            return nodes_;
        }

        [[nodiscard]] std::size_t node_count() const noexcept {
            return nodes_.size();
        }

        [[nodiscard]] std::size_t edge_count() const noexcept {
            return edge_count_;
        }

        [[nodiscard]] std::size_t external_count() const noexcept {
            return external_count_;
        }

        void set_root(fs::path root) {
            root_ = std::move(root);
        }

        [[nodiscard]] const std::optional<fs::path>& root() const noexcept {
            return root_;
        }

        /**
         * Returns path relative to the root when it lies under it, otherwise
         * path unchanged.
         */
        [[nodiscard]] fs::path relative_path(const fs::path& path) const;

    private:
        std::map<fs::path, GraphNode> nodes_;
        std::optional<fs::path> root_;
        std::size_t edge_count_ = 0;
        std::size_t external_count_ = 0;
    };

}  // namespace fdeps::graph

#endif //FDEPS_DEPENDENCY_GRAPH_HPP
