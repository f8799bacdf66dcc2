//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef FDEPS_MODULE_RESOLVER_HPP
#define FDEPS_MODULE_RESOLVER_HPP

/**
 * @file module_resolver.hpp
 * @brief Maps import references to files of the analyzed project.
 *
 * Resolution is heuristic. Absolute names are tried as given, then relative
 * to the importing file's directory and its grandparent, then by their dotted
 * prefixes. When several same-named modules exist the chosen file may differ
 * from what the interpreter would load.
 */

#include "fdeps/resolve/module_index.hpp"

#include <optional>
#include <string_view>

namespace fdeps::resolve {

    class ModuleResolver {
    public:
        /**
         * Builds the module index of root.
         */
        explicit ModuleResolver(const fs::path& root);

        explicit ModuleResolver(ModuleIndex index);

        /**
         * Resolves one import reference.
         *
         * @param module    Dotted module name; may be empty for relative imports.
         * @param from_file File containing the import.
         * @param level     0 for absolute imports, otherwise the number of dots.
         * @return The target file, or nullopt for standard-library, external
         *         and unresolvable references.
         */
        [[nodiscard]] std::optional<fs::path> resolve_import(
            std::string_view module,
            const fs::path& from_file,
            int level = 0
        ) const;

        [[nodiscard]] std::optional<fs::path> resolve_absolute(
            std::string_view module,
            const std::optional<fs::path>& from_file = std::nullopt
        ) const;

        /**
         * Resolves "from <dots><module> import ..." against from_file's package.
         *
         * Level 0 is handled as an absolute import.
         */
        [[nodiscard]] std::optional<fs::path> resolve_relative(
            std::string_view module,
            const fs::path& from_file,
            int level
        ) const;

        /**
         * True for names that are neither standard-library modules nor found
         * in the project, directly or as a package. Empty names are not
         * external.
         */
        [[nodiscard]] bool is_external(std::string_view module) const;

        [[nodiscard]] const ModuleIndex& index() const noexcept {
            return index_;
        }

        [[nodiscard]] const fs::path& root() const noexcept {
            return index_.root();
        }

    private:
        /// Directory segments of from_file relative to the root, or nullopt
        /// when the file lies outside it.
        [[nodiscard]] std::optional<std::vector<std::string>> package_segments(const fs::path& from_file) const;

        ModuleIndex index_;
    };

}  // namespace fdeps::resolve

#endif //FDEPS_MODULE_RESOLVER_HPP
