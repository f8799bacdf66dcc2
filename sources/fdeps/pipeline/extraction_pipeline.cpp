//
// Created by gregorian-rayne on 2/5/26.
//

#include "fdeps/pipeline/extraction_pipeline.hpp"
#include "fdeps/utils/parallel.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

namespace fdeps::pipeline {

    namespace {

    struct ChunkResult {
        FileImports imports;
        std::size_t degraded = 0;
    };

    ChunkResult extract_chunk(const extract::ExtractFn& extract_fn, const std::vector<fs::path>& chunk) {
        ChunkResult result;
        for (const auto& file : chunk) {
            bool ok = true;
            result.imports[file] = extract_or_empty(extract_fn, file, &ok);
            if (!ok) {
                ++result.degraded;
            }
        }
        return result;
    }

    void write_off(const std::vector<fs::path>& chunk, ExtractionOutcome& outcome) {
        for (const auto& file : chunk) {
            outcome.imports[file].clear();
        }
        outcome.degraded_files += chunk.size();
        ++outcome.failed_chunks;
    }

    }  // namespace

    ImportList extract_or_empty(const extract::ExtractFn& extract_fn, const fs::path& file, bool* ok) {
        if (ok) *ok = true;

        try {
            auto result = extract_fn(file);
            if (result.is_ok()) {
                return std::move(result).value();
            }
        } catch (const std::exception&) {
            // Treated like an error result.
        }

        if (ok) *ok = false;
        return {};
    }

    std::vector<std::vector<fs::path>> partition_files(const std::span<const fs::path> files,
                                                       const unsigned int workers) {
        std::vector<std::vector<fs::path>> chunks;
        if (files.empty()) {
            return chunks;
        }

        const std::size_t divisor = static_cast<std::size_t>(std::max(1u, workers)) * CHUNKS_PER_WORKER;
        const std::size_t chunk_size = std::max<std::size_t>(1, files.size() / divisor);

        for (std::size_t start = 0; start < files.size(); start += chunk_size) {
            const std::size_t end = std::min(files.size(), start + chunk_size);
            chunks.emplace_back(files.begin() + static_cast<std::ptrdiff_t>(start),
                                files.begin() + static_cast<std::ptrdiff_t>(end));
        }
        return chunks;
    }

    ExtractionPipeline::ExtractionPipeline(extract::ExtractFn extract_fn, const PipelineOptions options)
        : extract_fn_(std::move(extract_fn)),
          options_(options),
          workers_(options.workers == 0 ? parallel::hardware_concurrency() : options.workers) {}

    ExtractionOutcome ExtractionPipeline::extract_all(const std::span<const fs::path> files) const {
        ExtractionOutcome outcome;

        if (files.empty()) {
            return outcome;
        }

        if (files.size() <= INLINE_THRESHOLD) {
            for (const auto& file : files) {
                bool ok = true;
                outcome.imports[file] = extract_or_empty(extract_fn_, file, &ok);
                if (!ok) {
                    ++outcome.degraded_files;
                }
            }
            return outcome;
        }

        const auto chunks = partition_files(files, workers_);
        parallel::ThreadPool pool(workers_);

        std::vector<std::future<ChunkResult>> futures;
        futures.reserve(chunks.size());
        for (const auto& chunk : chunks) {
            futures.push_back(pool.submit([extract_fn = extract_fn_, chunk] {
                return extract_chunk(extract_fn, chunk);
            }));
        }
        outcome.chunks_dispatched = futures.size();

        for (std::size_t i = 0; i < futures.size(); ++i) {
            if (futures[i].wait_for(options_.chunk_timeout) != std::future_status::ready) {
                pool.abandon();
                write_off(chunks[i], outcome);
                continue;
            }

            try {
                auto result = futures[i].get();
                outcome.degraded_files += result.degraded;
                for (auto& [file, imports] : result.imports) {
                    outcome.imports[file] = std::move(imports);
                }
            } catch (const std::exception&) {
                write_off(chunks[i], outcome);
            }
        }

        return outcome;
    }

}  // namespace fdeps::pipeline
