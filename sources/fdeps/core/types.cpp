//
// Created by gregorian-rayne on 2/3/26.
//

#include "fdeps/types.hpp"
#include "fdeps/utils/string_utils.hpp"

#include <algorithm>

namespace fdeps {

    bool ImportRecord::is_wildcard() const noexcept {
        return std::ranges::find(names, WILDCARD_IMPORT) != names.end();
    }

    bool is_source_file(const fs::path& path) {
        return path.extension() == SOURCE_SUFFIX;
    }

    bool is_package_initializer(const fs::path& path) {
        return path.filename() == PACKAGE_INITIALIZER;
    }

    std::vector<std::string> split_module_name(const std::string_view dotted) {
        std::vector<std::string> segments;
        if (dotted.empty()) {
            return segments;
        }
        for (const auto part : string_utils::split(dotted, '.')) {
            segments.emplace_back(part);
        }
        return segments;
    }

    std::string join_module_name(const std::vector<std::string>& segments) {
        return string_utils::join(segments, ".");
    }

    std::string_view top_level_module(const std::string_view dotted) noexcept {
        const auto dot = dotted.find('.');
        return dot == std::string_view::npos ? dotted : dotted.substr(0, dot);
    }

}  // namespace fdeps
