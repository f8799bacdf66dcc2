//
// Created by gregorian-rayne on 2/6/26.
//

#include "fdeps/graph/graph_algorithms.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <queue>
#include <ranges>

namespace fdeps::graph {

    namespace {

    constexpr int UNVISITED = -1;

    /**
     * Breadth-first reachability from start, restricted to members.
     */
    std::size_t count_reachable(
        const DependencyGraph& graph,
        const std::set<fs::path>& members,
        const fs::path& start,
        const std::function<const std::set<fs::path>&(const GraphNode&)>& neighbours
    ) {
        std::set<fs::path> seen{start};
        std::queue<fs::path> queue;
        queue.push(start);

        while (!queue.empty()) {
            const auto current = std::move(queue.front());
            queue.pop();

            const auto* node = graph.node(current);
            if (!node) {
                continue;
            }
            for (const auto& next : neighbours(*node)) {
                if (members.contains(next) && seen.insert(next).second) {
                    queue.push(next);
                }
            }
        }

        return seen.size();
    }

    std::vector<RankedFile> top_ranked(std::vector<RankedFile> ranked) {
        std::ranges::stable_sort(ranked, [](const RankedFile& a, const RankedFile& b) {
            return a.count > b.count;
        });
        if (ranked.size() > TOP_RANKED) {
            ranked.resize(TOP_RANKED);
        }
        return ranked;
    }

    }  // namespace

    std::vector<Cycle> find_cycles(const DependencyGraph& graph) {
        std::vector<Cycle> cycles;

        std::vector<fs::path> paths;
        std::map<fs::path, int> ids;
        paths.reserve(graph.node_count());
        for (const auto& path : graph.nodes() | std::views::keys) {
            ids.emplace(path, static_cast<int>(paths.size()));
            paths.push_back(path);
        }

        std::vector<std::vector<int>> adjacency(paths.size());
        for (std::size_t i = 0; i < paths.size(); ++i) {
            for (const auto& target : graph.nodes().at(paths[i]).imports) {
                if (const auto it = ids.find(target); it != ids.end()) {
                    adjacency[i].push_back(it->second);
                }
            }
        }

        const auto n = paths.size();
        std::vector<int> index(n, UNVISITED);
        std::vector<int> lowlink(n, 0);
        std::vector<bool> on_stack(n, false);
        std::vector<int> scc_stack;
        int counter = 0;

        // (node, position of the next neighbour to visit)
        std::vector<std::pair<int, std::size_t>> frames;

        const auto visit = [&](const int v) {
            index[v] = lowlink[v] = counter++;
            scc_stack.push_back(v);
            on_stack[v] = true;
            frames.emplace_back(v, 0);
        };

        for (int start = 0; start < static_cast<int>(n); ++start) {
            if (index[start] != UNVISITED) {
                continue;
            }
            visit(start);

            while (!frames.empty()) {
                const int u = frames.back().first;
                const std::size_t pos = frames.back().second;

                if (pos < adjacency[u].size()) {
                    ++frames.back().second;
                    const int w = adjacency[u][pos];
                    if (index[w] == UNVISITED) {
                        visit(w);
                    } else if (on_stack[w]) {
                        lowlink[u] = std::min(lowlink[u], index[w]);
                    }
                    continue;
                }

                frames.pop_back();
                if (!frames.empty()) {
                    const int parent = frames.back().first;
                    lowlink[parent] = std::min(lowlink[parent], lowlink[u]);
                }

                if (lowlink[u] != index[u]) {
                    continue;
                }

                std::vector<int> members;
                int w;
                do {
                    w = scc_stack.back();
                    scc_stack.pop_back();
                    on_stack[w] = false;
                    members.push_back(w);
                } while (w != u);

                if (members.size() < 2) {
                    continue;
                }

                std::ranges::sort(members, [&index](const int a, const int b) {
                    return index[a] < index[b];
                });

                Cycle cycle;
                cycle.files.reserve(members.size());
                for (const int m : members) {
                    cycle.files.push_back(paths[m]);
                }

                if (is_strongly_connected(graph, cycle.files)) {
                    cycles.push_back(std::move(cycle));
                }
            }
        }

        std::ranges::sort(cycles, [](const Cycle& a, const Cycle& b) {
            return std::ranges::min(a.files) < std::ranges::min(b.files);
        });
        return cycles;
    }

    bool is_strongly_connected(const DependencyGraph& graph, const std::vector<fs::path>& component) {
        if (component.size() < 2) {
            return false;
        }

        const std::set<fs::path> members(component.begin(), component.end());
        if (std::ranges::any_of(members, [&graph](const fs::path& p) { return !graph.has_file(p); })) {
            return false;
        }

        const auto& start = component.front();
        const auto forward = count_reachable(graph, members, start,
            [](const GraphNode& node) -> const std::set<fs::path>& { return node.imports; });
        if (forward != members.size()) {
            return false;
        }

        const auto backward = count_reachable(graph, members, start,
            [](const GraphNode& node) -> const std::set<fs::path>& { return node.imported_by; });
        return backward == members.size();
    }

    GraphStats compute_stats(const DependencyGraph& graph) {
        GraphStats stats;
        stats.total_files = graph.node_count();
        stats.total_dependencies = graph.edge_count();
        stats.total_external = graph.external_count();
        stats.cycle_list = find_cycles(graph);
        stats.cycles = stats.cycle_list.size();

        std::vector<RankedFile> imported;
        std::vector<RankedFile> importing;
        for (const auto& [path, node] : graph.nodes()) {
            if (!node.imported_by.empty()) {
                imported.push_back({path, node.imported_by.size()});
            }
            importing.push_back({path, node.imports.size()});
        }

        stats.most_imported = top_ranked(std::move(imported));
        stats.most_imports = top_ranked(std::move(importing));
        return stats;
    }

}  // namespace fdeps::graph
