//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef FDEPS_TYPES_HPP
#define FDEPS_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data types shared across the analysis pipeline.
 *
 * Source files are identified by their canonical filesystem path. Import
 * statements are described by ImportRecord, produced by an extractor and
 * consumed by the resolver.
 */

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fdeps {

    namespace fs = std::filesystem;

    /// Suffix of analyzable source files.
    inline constexpr std::string_view SOURCE_SUFFIX = ".py";

    /// File that marks a directory as an importable package.
    inline constexpr std::string_view PACKAGE_INITIALIZER = "__init__.py";

    /// Imported-name marker for "from m import *".
    inline constexpr std::string_view WILDCARD_IMPORT = "*";

    /**
     * One import statement, or one module of a multi-module "import a, b".
     */
    struct ImportRecord {
        /// Dotted module name. Empty for "from . import x".
        std::string module;

        /// Names bound by a from-import, in source order. Empty for plain imports.
        std::vector<std::string> names;

        /// 0 for absolute imports, otherwise the number of leading dots.
        int level = 0;

        /// 1-based line of the statement start.
        std::size_t line = 0;

        bool is_from = false;

        [[nodiscard]] bool is_relative() const noexcept {
            return level > 0;
        }

        [[nodiscard]] bool is_wildcard() const noexcept;

        bool operator==(const ImportRecord& other) const = default;
    };

    using ImportList = std::vector<ImportRecord>;

    /// Import records per source file, ordered by path.
    using FileImports = std::map<fs::path, ImportList>;

    /**
     * Checks whether a path names a source file by suffix.
     */
    [[nodiscard]] bool is_source_file(const fs::path& path);

    /**
     * Checks whether a path names a package initializer.
     */
    [[nodiscard]] bool is_package_initializer(const fs::path& path);

    /**
     * Splits a dotted module name into its segments. Empty input gives no segments.
     */
    [[nodiscard]] std::vector<std::string> split_module_name(std::string_view dotted);

    /**
     * Joins module name segments with '.'.
     */
    [[nodiscard]] std::string join_module_name(const std::vector<std::string>& segments);

    /**
     * Returns the leading segment of a dotted name ("os" for "os.path").
     */
    [[nodiscard]] std::string_view top_level_module(std::string_view dotted) noexcept;

}  // namespace fdeps

#endif //FDEPS_TYPES_HPP
