//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef FDEPS_MODULE_INDEX_HPP
#define FDEPS_MODULE_INDEX_HPP

/**
 * @file module_index.hpp
 * @brief Immutable map from dotted module names to files under a root.
 */

#include "fdeps/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fdeps::resolve {

    /**
     * Dotted-name index of every source file below a project root.
     *
     * "pkg/mod.py" is indexed as "pkg.mod" and "pkg/__init__.py" as "pkg";
     * a root-level initializer is indexed under the empty name. When a module
     * file and a package share a dotted name, the package initializer wins.
     *
     * Built once and never modified afterwards, so concurrent lookups are safe.
     */
    class ModuleIndex {
    public:
        ModuleIndex() = default;

        /**
         * Walks root and indexes every source file.
         *
         * Symlinked directories are not followed and unreadable subtrees are
         * skipped. A root that is not a directory gives an empty index.
         */
        [[nodiscard]] static ModuleIndex build(const fs::path& root);

        /**
         * Looks a dotted name up directly.
         */
        [[nodiscard]] std::optional<fs::path> find(std::string_view dotted) const;

        /**
         * Looks a dotted name up as a package: the directory it names must
         * contain an initializer, which is returned.
         */
        [[nodiscard]] std::optional<fs::path> find_package(std::string_view dotted) const;

        /**
         * Direct lookup, then package lookup.
         */
        [[nodiscard]] std::optional<fs::path> find_module_or_package(std::string_view dotted) const;

        [[nodiscard]] bool is_package_dir(const fs::path& dir) const {
            return package_dirs_.contains(dir);
        }

        /**
         * Returns the dotted name of a root-relative source path.
         */
        [[nodiscard]] static std::string module_name_for(const fs::path& relative_path);

        [[nodiscard]] const fs::path& root() const noexcept {
            return root_;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return file_index_.size();
        }

        [[nodiscard]] std::size_t package_count() const noexcept {
            return package_dirs_.size();
        }

        [[nodiscard]] const std::unordered_map<std::string, fs::path>& entries() const noexcept {
            return file_index_;
        }

    private:
        fs::path root_;
        std::unordered_map<std::string, fs::path> file_index_;
        std::set<fs::path> package_dirs_;
    };

}  // namespace fdeps::resolve

#endif //FDEPS_MODULE_INDEX_HPP
