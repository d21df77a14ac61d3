#include "dependency_graph.hpp"
#include <algorithm>
#include <queue>

namespace loopcalc {

namespace {

std::vector<size_t> reachable(const std::vector<std::vector<size_t>>& adjacency, const std::vector<size_t>& seeds) {
    std::vector<bool> visited(adjacency.size(), false);
    std::queue<size_t> pending;

    for (size_t seed : seeds) {
        if (seed < adjacency.size() && !visited[seed]) {
            visited[seed] = true;
            pending.push(seed);
        }
    }

    while (!pending.empty()) {
        size_t current = pending.front();
        pending.pop();
        for (size_t next : adjacency[current]) {
            if (!visited[next]) {
                visited[next] = true;
                pending.push(next);
            }
        }
    }

    std::vector<size_t> result;
    for (size_t i = 0; i < visited.size(); ++i) {
        if (visited[i]) {
            result.push_back(i);
        }
    }
    return result;
}

} // anonymous namespace

bool DependencyGraph::has_edge(size_t from, size_t to) const {
    if (from >= node_count) {
        return false;
    }
    const auto& out = dependents[from];
    return std::find(out.begin(), out.end(), to) != out.end();
}

DependencyGraph build_dependency_graph(const ModelRegistry& registry) {
    if (!registry.is_sealed()) {
        throw DefinitionError("Dependency graph requires a sealed model registry");
    }

    DependencyGraph graph;
    graph.node_count = registry.size();
    graph.dependents.assign(graph.node_count, {});
    graph.dependencies.assign(graph.node_count, {});
    graph.self_loop.assign(graph.node_count, false);

    for (const auto& attribute : registry.attributes()) {
        if (!attribute.is_calculated()) {
            continue;
        }

        if (attribute.dependency_indices.size() != attribute.dependencies.size()) {
            throw UnknownDependencyError("Unresolved dependencies of attribute: " + attribute.identity);
        }

        for (size_t i = 0; i < attribute.dependency_indices.size(); ++i) {
            size_t from = attribute.dependency_indices[i];
            size_t to = attribute.index;

            if (from >= graph.node_count || registry.at(from).identity != attribute.dependencies[i]) {
                throw UnknownDependencyError("Dependency '" + attribute.dependencies[i] +
                                             "' of attribute '" + attribute.identity + "' does not resolve");
            }

            graph.dependents[from].push_back(to);
            graph.dependencies[to].push_back(from);
            graph.edge_count++;

            if (from == to) {
                graph.self_loop[to] = true;
            }
        }
    }

    for (auto& out : graph.dependents) {
        std::sort(out.begin(), out.end());
    }

    return graph;
}

std::vector<size_t> downstream_closure(const DependencyGraph& graph, size_t node) {
    return reachable(graph.dependents, {node});
}

std::vector<size_t> upstream_closure(const DependencyGraph& graph, const std::vector<size_t>& nodes) {
    return reachable(graph.dependencies, nodes);
}

} // namespace loopcalc
