//
// Created by gregorian-rayne on 2/8/26.
//

#ifndef FDEPS_DEPENDENCY_ANALYZER_HPP
#define FDEPS_DEPENDENCY_ANALYZER_HPP

/**
 * @file dependency_analyzer.hpp
 * @brief End-to-end analysis of a file or directory.
 *
 * Scans the target, extracts imports in parallel, resolves every import
 * against the project index and accumulates the dependency graph. The graph
 * is only built after all extraction results have been collected.
 */

#include "fdeps/config.hpp"
#include "fdeps/extract/import_extractor.hpp"
#include "fdeps/graph/dependency_graph.hpp"
#include "fdeps/resolve/module_resolver.hpp"

#include <chrono>

namespace fdeps::analysis {

    struct AnalysisSummary {
        std::size_t files_found = 0;
        std::size_t files_extracted = 0;
        std::size_t degraded_files = 0;
        std::size_t chunks_dispatched = 0;
        std::chrono::milliseconds elapsed{0};
    };

    struct AnalysisResult {
        graph::DependencyGraph graph;
        AnalysisSummary summary;

        /// Canonical project root the graph was built against.
        fs::path root;
    };

    /**
     * Adds the edges and external names of one file's imports to graph.
     *
     * Bare relative imports ("from . import a, b") link each name that is a
     * submodule; the package itself is linked when some name is not a
     * submodule or the import is a wildcard.
     */
    void link_imports(
        graph::DependencyGraph& graph,
        const resolve::ModuleResolver& resolver,
        const fs::path& file,
        const ImportList& imports,
        bool internal_only
    );

    class DependencyAnalyzer {
    public:
        /**
         * @param extract_fn Extraction callable; defaults to the Python
         *                   extractor configured from config.
         */
        explicit DependencyAnalyzer(AnalyzerConfig config, extract::ExtractFn extract_fn = {});

        /**
         * Analyzes a source file or a directory tree.
         *
         * A file target is analyzed alone with its directory as the project
         * root.
         *
         * @return ConfigError when the target does not exist or the
         *         configuration is invalid.
         */
        [[nodiscard]] Result<AnalysisResult, Error> analyze(const fs::path& target) const;

        [[nodiscard]] const AnalyzerConfig& config() const noexcept {
            return config_;
        }

    private:
        AnalyzerConfig config_;
        extract::ExtractFn extract_fn_;
    };

}  // namespace fdeps::analysis

#endif //FDEPS_DEPENDENCY_ANALYZER_HPP
