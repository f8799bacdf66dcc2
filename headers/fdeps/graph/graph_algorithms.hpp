//
// Created by gregorian-rayne on 2/6/26.
//

#ifndef FDEPS_GRAPH_ALGORITHMS_HPP
#define FDEPS_GRAPH_ALGORITHMS_HPP

/**
 * @file graph_algorithms.hpp
 * @brief Read-only analyses over a finished DependencyGraph.
 */

#include "fdeps/graph/dependency_graph.hpp"

#include <cstddef>
#include <vector>

namespace fdeps::graph {

    /// Number of entries kept in each ranking of GraphStats.
    inline constexpr std::size_t TOP_RANKED = 5;

    /**
     * A strongly connected set of two or more files, in discovery order.
     */
    struct Cycle {
        std::vector<fs::path> files;

        [[nodiscard]] std::size_t size() const noexcept {
            return files.size();
        }
    };

    struct RankedFile {
        fs::path path;
        std::size_t count = 0;
    };

    struct GraphStats {
        std::size_t total_files = 0;
        std::size_t total_dependencies = 0;
        std::size_t total_external = 0;
        std::size_t cycles = 0;

        /// The cycles counted above, as find_cycles() returns them.
        std::vector<Cycle> cycle_list;

        /// Files with the most dependents; only files imported at least once.
        std::vector<RankedFile> most_imported;

        /// Files with the most internal imports.
        std::vector<RankedFile> most_imports;
    };

    /**
     * Finds circular dependencies.
     *
     * Uses an iterative form of Tarjan's algorithm so deep import chains
     * cannot exhaust the call stack. Single-file components, including files
     * that import themselves, are not reported. Cycles are ordered by their
     * smallest path.
     */
    [[nodiscard]] std::vector<Cycle> find_cycles(const DependencyGraph& graph);

    /**
     * Checks that every member of component reaches every other member using
     * only edges inside the component. Components of fewer than two files
     * are never strongly connected here.
     */
    [[nodiscard]] bool is_strongly_connected(
        const DependencyGraph& graph,
        const std::vector<fs::path>& component
    );

    /**
     * Computes totals and top-5 rankings. Ties keep path order.
     */
    [[nodiscard]] GraphStats compute_stats(const DependencyGraph& graph);

}  // namespace fdeps::graph

#endif //FDEPS_GRAPH_ALGORITHMS_HPP
