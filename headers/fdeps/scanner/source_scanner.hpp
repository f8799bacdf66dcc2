//
// Created by gregorian-rayne on 2/4/26.
//

#ifndef FDEPS_SOURCE_SCANNER_HPP
#define FDEPS_SOURCE_SCANNER_HPP

/**
 * @file source_scanner.hpp
 * @brief Discovery of candidate source files under a project root.
 *
 * The walk never follows symlinked directories, prunes hidden and excluded
 * directories, and prunes any path matching an ignore glob. Unreadable
 * subtrees are skipped silently.
 */

#include "fdeps/types.hpp"

#include <regex>
#include <set>
#include <string>
#include <vector>

namespace fdeps::scanner {

    /**
     * Directory names skipped by default.
     */
    [[nodiscard]] const std::set<std::string>& default_exclude_dirs();

    struct ScanOptions {
        /// Directory names pruned wherever they appear.
        std::set<std::string> exclude_dirs = default_exclude_dirs();

        /// fnmatch-style globs matched against relative paths and path segments.
        std::vector<std::string> ignore_patterns;
    };

    /**
     * Converts an fnmatch-style glob to an anchored ECMAScript regex.
     *
     * '*' matches any run of characters including '/', '?' one character,
     * "[abc]" and "[!abc]" character classes; everything else is literal.
     */
    [[nodiscard]] std::string glob_to_regex(std::string_view glob);

    /**
     * Matches root-relative paths against a set of ignore globs.
     *
     * A path matches when a glob matches the whole relative path or any
     * single segment of it. Globs with a leading recursive wildcard segment
     * ("**" then '/') are also tried with that segment removed, so they
     * match at the top level as well.
     */
    class IgnoreMatcher {
    public:
        explicit IgnoreMatcher(const std::vector<std::string>& patterns);

        [[nodiscard]] bool matches(const fs::path& relative_path) const;

        [[nodiscard]] bool empty() const noexcept {
            return patterns_.empty();
        }

        /// Number of patterns that compiled successfully.
        [[nodiscard]] std::size_t size() const noexcept {
            return patterns_.size();
        }

    private:
        std::vector<std::regex> patterns_;
    };

    /**
     * Returns the sorted list of source files under root.
     *
     * A root that is not a readable directory yields an empty list.
     */
    [[nodiscard]] std::vector<fs::path> discover_source_files(
        const fs::path& root,
        const ScanOptions& options = {}
    );

}  // namespace fdeps::scanner

#endif //FDEPS_SOURCE_SCANNER_HPP
