//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef FDEPS_EXTRACTION_PIPELINE_HPP
#define FDEPS_EXTRACTION_PIPELINE_HPP

/**
 * @file extraction_pipeline.hpp
 * @brief Concurrent, failure-tolerant import extraction over many files.
 *
 * The pipeline never reports an error. A file whose extraction fails gets an
 * empty import list; a chunk that fails or times out as a whole gets empty
 * lists for all of its files. Degradation is visible only through the
 * counters in ExtractionOutcome.
 */

#include "fdeps/extract/import_extractor.hpp"

#include <chrono>
#include <cstddef>
#include <span>
#include <vector>

namespace fdeps::pipeline {

    /// Inputs up to this size are extracted on the calling thread.
    inline constexpr std::size_t INLINE_THRESHOLD = 3;

    /// Target number of chunks per worker.
    inline constexpr std::size_t CHUNKS_PER_WORKER = 4;

    /// Default bound on waiting for one chunk.
    inline constexpr std::chrono::milliseconds DEFAULT_CHUNK_TIMEOUT{30000};

    struct PipelineOptions {
        /// Worker count; 0 selects the hardware concurrency.
        unsigned int workers = 0;

        std::chrono::milliseconds chunk_timeout = DEFAULT_CHUNK_TIMEOUT;
    };

    struct ExtractionOutcome {
        /// One entry per input file.
        FileImports imports;

        /// Chunks handed to the worker pool. Zero for inline extraction.
        std::size_t chunks_dispatched = 0;

        /// Files that ended with an empty list because extraction failed.
        std::size_t degraded_files = 0;

        /// Chunks lost as a whole to a timeout or an escaped exception.
        std::size_t failed_chunks = 0;
    };

    /**
     * Runs an extractor on one file, mapping any failure to an empty list.
     *
     * @param ok Set to false when the extractor failed or threw.
     */
    [[nodiscard]] ImportList extract_or_empty(
        const extract::ExtractFn& extract_fn,
        const fs::path& file,
        bool* ok = nullptr
    );

    /**
     * Splits files into contiguous chunks of max(1, n / (workers * 4)) files.
     */
    [[nodiscard]] std::vector<std::vector<fs::path>> partition_files(
        std::span<const fs::path> files,
        unsigned int workers
    );

    class ExtractionPipeline {
    public:
        explicit ExtractionPipeline(extract::ExtractFn extract_fn, PipelineOptions options = {});

        /**
         * Extracts import records for every file.
         *
         * Small inputs run inline; larger ones are chunked over a worker pool
         * and merged here as each chunk completes. A chunk not finished within
         * the timeout is written off and the pool is abandoned, so a stuck
         * extraction never blocks the caller.
         */
        [[nodiscard]] ExtractionOutcome extract_all(std::span<const fs::path> files) const;

        [[nodiscard]] unsigned int workers() const noexcept {
            return workers_;
        }

        [[nodiscard]] const PipelineOptions& options() const noexcept {
            return options_;
        }

    private:
        extract::ExtractFn extract_fn_;
        PipelineOptions options_;
        unsigned int workers_;
    };

}  // namespace fdeps::pipeline

#endif //FDEPS_EXTRACTION_PIPELINE_HPP
