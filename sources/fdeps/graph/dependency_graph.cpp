//
// Created by gregorian-rayne on 2/6/26.
//

#include "fdeps/graph/dependency_graph.hpp"

namespace fdeps::graph {

    GraphNode& DependencyGraph::add_file(const fs::path& path) {
        auto [it, inserted] = nodes_.try_emplace(path);
        if (inserted) {
            it->second.path = path;
        }
        return it->second;
    }

    void DependencyGraph::add_dependency(const fs::path& from, const fs::path& to) {
        add_file(to);
        auto& source = add_file(from);

        if (source.imports.insert(to).second) {
            ++edge_count_;
        }
        nodes_.at(to).imported_by.insert(from);
    }

    void DependencyGraph::add_external(const fs::path& from, const std::string& module) {
        if (add_file(from).external_imports.insert(module).second) {
            ++external_count_;
        }
    }

    bool DependencyGraph::has_dependency(const fs::path& from, const fs::path& to) const {
        const auto it = nodes_.find(from);
        return it != nodes_.end() && it->second.imports.contains(to);
    }

    const GraphNode* DependencyGraph::node(const fs::path& path) const {
        const auto it = nodes_.find(path);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    fs::path DependencyGraph::relative_path(const fs::path& path) const {
        if (!root_) {
            return path;
        }

        auto relative = path.lexically_relative(*root_);
        if (relative.empty() || *relative.begin() == "..") {
            return path;
        }
        return relative;
    }

}  // namespace fdeps::graph
