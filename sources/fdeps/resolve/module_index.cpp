//
// Created by gregorian-rayne on 2/5/26.
//

#include "fdeps/resolve/module_index.hpp"

#include <system_error>
#include <vector>

namespace fdeps::resolve {

    ModuleIndex ModuleIndex::build(const fs::path& root) {
        ModuleIndex index;
        index.root_ = root;

        if (std::error_code ec; !fs::is_directory(root, ec)) {
            return index;
        }

        std::vector<fs::path> pending{root};
        while (!pending.empty()) {
            const fs::path dir = std::move(pending.back());
            pending.pop_back();

            std::error_code ec;
            for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
                 !ec && it != end; it.increment(ec)) {
                const auto& entry = *it;

                std::error_code status_ec;
                const bool is_link = entry.is_symlink(status_ec);
                if (entry.is_directory(status_ec)) {
                    if (!is_link) {
                        pending.push_back(entry.path());
                    }
                    continue;
                }

                if (!entry.is_regular_file(status_ec) || !is_source_file(entry.path())) {
                    continue;
                }

                const auto& path = entry.path();
                auto name = module_name_for(path.lexically_relative(root));

                if (is_package_initializer(path)) {
                    index.package_dirs_.insert(path.parent_path());
                    index.file_index_.insert_or_assign(std::move(name), path);
                } else {
                    index.file_index_.try_emplace(std::move(name), path);
                }
            }
        }

        return index;
    }

    std::optional<fs::path> ModuleIndex::find(const std::string_view dotted) const {
        if (const auto it = file_index_.find(std::string(dotted)); it != file_index_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<fs::path> ModuleIndex::find_package(const std::string_view dotted) const {
        fs::path dir = root_;
        for (const auto& segment : split_module_name(dotted)) {
            dir /= segment;
        }

        if (!package_dirs_.contains(dir)) {
            return std::nullopt;
        }
        return dir / PACKAGE_INITIALIZER;
    }

    std::optional<fs::path> ModuleIndex::find_module_or_package(const std::string_view dotted) const {
        if (auto direct = find(dotted)) {
            return direct;
        }
        return find_package(dotted);
    }

    std::string ModuleIndex::module_name_for(const fs::path& relative_path) {
        std::vector<std::string> segments;
        const auto parent = relative_path.parent_path();
        for (const auto& part : parent) {
            if (auto s = part.string(); !s.empty() && s != ".") {
                segments.push_back(std::move(s));
            }
        }

        if (!is_package_initializer(relative_path)) {
            segments.push_back(relative_path.stem().string());
        }

        return join_module_name(segments);
    }

}  // namespace fdeps::resolve
