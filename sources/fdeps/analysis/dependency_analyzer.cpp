//
// Created by gregorian-rayne on 2/8/26.
//

#include "fdeps/analysis/dependency_analyzer.hpp"
#include "fdeps/extract/python_import_extractor.hpp"
#include "fdeps/pipeline/extraction_pipeline.hpp"
#include "fdeps/scanner/source_scanner.hpp"

#include <memory>

namespace fdeps::analysis {

    namespace {

    extract::ExtractFn default_extract_fn(const AnalyzerConfig& config) {
        auto extractor = std::make_shared<extract::PythonImportExtractor>(
            static_cast<std::size_t>(config.initial_window_bytes));
        return [extractor](const fs::path& path) {
            return extractor->extract(path);
        };
    }

    void link(graph::DependencyGraph& graph, const fs::path& file, const std::optional<fs::path>& target) {
        if (target) {
            graph.add_dependency(file, *target);
        }
    }

    }  // namespace

    void link_imports(graph::DependencyGraph& graph,
                      const resolve::ModuleResolver& resolver,
                      const fs::path& file,
                      const ImportList& imports,
                      const bool internal_only) {
        graph.add_file(file);

        for (const auto& record : imports) {
            if (!record.is_relative()) {
                if (auto target = resolver.resolve_absolute(record.module, file)) {
                    graph.add_dependency(file, *target);
                } else if (!internal_only && !record.module.empty() && resolver.is_external(record.module)) {
                    graph.add_external(file, record.module);
                }
                continue;
            }

            // An unresolved relative import is dropped, never recorded as external:
            // a leading dot always names a module inside the project.
            if (!record.module.empty()) {
                link(graph, file, resolver.resolve_relative(record.module, file, record.level));
                continue;
            }

            // "from . import a, b": the names may be submodules or attributes of the package.
            bool link_package = record.names.empty() || record.is_wildcard();
            for (const auto& name : record.names) {
                if (name == WILDCARD_IMPORT) {
                    continue;
                }
                if (auto target = resolver.resolve_relative(name, file, record.level)) {
                    graph.add_dependency(file, *target);
                } else {
                    link_package = true;
                }
            }

            if (link_package) {
                link(graph, file, resolver.resolve_relative("", file, record.level));
            }
        }
    }

    DependencyAnalyzer::DependencyAnalyzer(AnalyzerConfig config, extract::ExtractFn extract_fn)
        : config_(std::move(config)),
          extract_fn_(extract_fn ? std::move(extract_fn) : default_extract_fn(config_)) {}

    Result<AnalysisResult, Error> DependencyAnalyzer::analyze(const fs::path& target) const {
        using R = Result<AnalysisResult, Error>;
        const auto start = std::chrono::steady_clock::now();

        if (auto valid = config_.validate(); valid.is_err()) {
            return R::failure(valid.error());
        }

        std::error_code ec;
        if (!fs::exists(target, ec)) {
            return R::failure(Error::config_error("Target not found", target.string()));
        }

        const auto canonical = fs::weakly_canonical(target, ec);
        if (ec) {
            return R::failure(Error::config_error("Cannot resolve target: " + ec.message(), target.string()));
        }

        AnalysisResult result;
        std::vector<fs::path> files;

        if (fs::is_directory(canonical, ec)) {
            result.root = canonical;
            scanner::ScanOptions options;
            options.exclude_dirs = config_.exclude_dirs;
            options.ignore_patterns = config_.ignore_patterns;
            files = scanner::discover_source_files(result.root, options);
        } else {
            result.root = canonical.parent_path();
            files.push_back(canonical);
        }
        result.summary.files_found = files.size();

        pipeline::PipelineOptions pipeline_options;
        pipeline_options.workers = static_cast<unsigned int>(config_.workers);
        pipeline_options.chunk_timeout = config_.chunk_timeout;

        const pipeline::ExtractionPipeline pipeline(extract_fn_, pipeline_options);
        const auto outcome = pipeline.extract_all(files);

        result.summary.files_extracted = outcome.imports.size();
        result.summary.degraded_files = outcome.degraded_files;
        result.summary.chunks_dispatched = outcome.chunks_dispatched;

        const resolve::ModuleResolver resolver(result.root);
        result.graph.set_root(result.root);

        for (const auto& [file, imports] : outcome.imports) {
            link_imports(result.graph, resolver, file, imports, config_.internal_only);
        }

        result.summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        return R::success(std::move(result));
    }

}  // namespace fdeps::analysis
