#ifndef LOOPCALC_DEPENDENCY_GRAPH_HPP
#define LOOPCALC_DEPENDENCY_GRAPH_HPP

#include "model_registry.hpp"
#include <cstddef>
#include <vector>

namespace loopcalc {

/**
 * @brief Directed graph over attribute indices
 *
 * One node per attribute (node i == ModelRegistry::at(i)). Edges run
 * dependency -> dependent. Both directions are stored: `dependents` is the
 * forward adjacency, `dependencies` the reverse index.
 */
struct DependencyGraph {
    size_t node_count;
    size_t edge_count;
    std::vector<std::vector<size_t>> dependents;     ///< node -> nodes that read it
    std::vector<std::vector<size_t>> dependencies;   ///< node -> nodes it reads
    std::vector<bool> self_loop;                     ///< node reads itself

    DependencyGraph() : node_count(0), edge_count(0) {}

    bool has_edge(size_t from, size_t to) const;
};

/**
 * @brief Build the dependency graph from a sealed registry
 *
 * Self-dependencies are kept as self-loops (the analyzer treats them as
 * cyclic groups).
 *
 * @throws DefinitionError if the registry is not sealed
 * @throws UnknownDependencyError if a dependency does not resolve
 */
DependencyGraph build_dependency_graph(const ModelRegistry& registry);

/**
 * @brief Every node reachable from `node` along dependency -> dependent edges
 *
 * Includes `node` itself. Sorted ascending.
 */
std::vector<size_t> downstream_closure(const DependencyGraph& graph, size_t node);

/**
 * @brief Every node that `nodes` transitively read, including `nodes`. Sorted ascending.
 */
std::vector<size_t> upstream_closure(const DependencyGraph& graph, const std::vector<size_t>& nodes);

} // namespace loopcalc

#endif // LOOPCALC_DEPENDENCY_GRAPH_HPP
