//
// Created by gregorian-rayne on 2/4/26.
//

#ifndef FDEPS_PYTHON_IMPORT_EXTRACTOR_HPP
#define FDEPS_PYTHON_IMPORT_EXTRACTOR_HPP

/**
 * @file python_import_extractor.hpp
 * @brief Lexical import extractor for Python source.
 *
 * Recognizes:
 * - import a, b.c as d
 * - from m import x, y as z
 * - from m import (x,
 *                  y)
 * - from . import x / from ..pkg import *
 *
 * Comments and string literals are skipped, bracketed and backslash-continued
 * lines are joined, and statements nested in function or class bodies are
 * found as well. Nothing is evaluated.
 *
 * Most imports sit at the top of a file, so only an initial byte window is
 * parsed first; the whole file is re-parsed only when the window does not
 * parse cleanly (for example when it ends inside a docstring).
 */

#include "fdeps/extract/import_extractor.hpp"

#include <cstddef>
#include <string_view>

namespace fdeps::extract {

    /// Default size of the initial parse window.
    inline constexpr std::size_t DEFAULT_INITIAL_WINDOW_BYTES = 10240;

    class PythonImportExtractor : public IImportExtractor {
    public:
        explicit PythonImportExtractor(std::size_t initial_window_bytes = DEFAULT_INITIAL_WINDOW_BYTES);

        [[nodiscard]] std::string_view name() const noexcept override {
            return "PythonImportExtractor";
        }

        [[nodiscard]] Result<ImportList, Error> extract(const fs::path& path) const override;

        /**
         * Parses source text directly.
         *
         * @return ParseError for unterminated strings or brackets, unmatched
         *         closing brackets, or malformed import statements.
         */
        [[nodiscard]] static Result<ImportList, Error> parse_source(std::string_view source);

        [[nodiscard]] std::size_t initial_window_bytes() const noexcept {
            return initial_window_bytes_;
        }

    private:
        std::size_t initial_window_bytes_;
    };

}  // namespace fdeps::extract

#endif //FDEPS_PYTHON_IMPORT_EXTRACTOR_HPP
