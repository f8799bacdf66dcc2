//
// Created by gregorian-rayne on 2/5/26.
//

#include "fdeps/resolve/module_resolver.hpp"
#include "fdeps/resolve/stdlib_modules.hpp"

#include <iterator>

namespace fdeps::resolve {

    ModuleResolver::ModuleResolver(const fs::path& root)
        : index_(ModuleIndex::build(root)) {}

    ModuleResolver::ModuleResolver(ModuleIndex index)
        : index_(std::move(index)) {}

    std::optional<fs::path> ModuleResolver::resolve_import(const std::string_view module,
                                                           const fs::path& from_file,
                                                           const int level) const {
        if (level <= 0) {
            return resolve_absolute(module, from_file);
        }
        return resolve_relative(module, from_file, level);
    }

    std::optional<fs::path> ModuleResolver::resolve_absolute(const std::string_view module,
                                                             const std::optional<fs::path>& from_file) const {
        if (module.empty() || is_stdlib_module(module)) {
            return std::nullopt;
        }

        const auto segments = split_module_name(module);

        // Imports spelled with the project's own package name.
        if (segments.size() > 1 && root().filename().string() == segments.front()) {
            const std::vector<std::string> stripped(segments.begin() + 1, segments.end());
            if (auto hit = index_.find_module_or_package(join_module_name(stripped))) {
                return hit;
            }
        }

        if (auto hit = index_.find_module_or_package(module)) {
            return hit;
        }

        if (from_file) {
            if (const auto dir = package_segments(*from_file); dir && !dir->empty()) {
                auto sibling = *dir;
                sibling.insert(sibling.end(), segments.begin(), segments.end());
                if (auto hit = index_.find_module_or_package(join_module_name(sibling))) {
                    return hit;
                }

                if (dir->size() > 1) {
                    std::vector<std::string> uncle(dir->begin(), std::prev(dir->end()));
                    uncle.insert(uncle.end(), segments.begin(), segments.end());
                    if (auto hit = index_.find_module_or_package(join_module_name(uncle))) {
                        return hit;
                    }
                }
            }
        }

        for (std::size_t len = segments.size() - 1; len > 0; --len) {
            const std::vector<std::string> prefix(segments.begin(),
                                                  segments.begin() + static_cast<std::ptrdiff_t>(len));
            if (auto hit = index_.find_module_or_package(join_module_name(prefix))) {
                return hit;
            }
        }

        return std::nullopt;
    }

    std::optional<fs::path> ModuleResolver::resolve_relative(const std::string_view module,
                                                             const fs::path& from_file,
                                                             const int level) const {
        if (level <= 0) {
            return resolve_absolute(module, from_file);
        }

        auto target = package_segments(from_file);
        if (!target) {
            return std::nullopt;
        }

        const auto depth = static_cast<int>(target->size());
        if (level > depth + 1) {
            return std::nullopt;
        }
        target->resize(static_cast<std::size_t>(depth - (level - 1)));

        for (auto& segment : split_module_name(module)) {
            target->push_back(std::move(segment));
        }

        return index_.find_module_or_package(join_module_name(*target));
    }

    bool ModuleResolver::is_external(const std::string_view module) const {
        if (module.empty() || is_stdlib_module(module)) {
            return false;
        }
        return !index_.find_module_or_package(module).has_value();
    }

    std::optional<std::vector<std::string>> ModuleResolver::package_segments(const fs::path& from_file) const {
        const auto relative = from_file.lexically_relative(root());
        if (relative.empty()) {
            return std::nullopt;
        }

        std::vector<std::string> segments;
        for (const auto& part : relative.parent_path()) {
            auto s = part.string();
            if (s == "..") {
                return std::nullopt;
            }
            if (!s.empty() && s != ".") {
                segments.push_back(std::move(s));
            }
        }
        return segments;
    }

}  // namespace fdeps::resolve
