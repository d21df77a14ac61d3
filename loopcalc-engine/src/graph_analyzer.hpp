#ifndef LOOPCALC_GRAPH_ANALYZER_HPP
#define LOOPCALC_GRAPH_ANALYZER_HPP

#include "dependency_graph.hpp"
#include <cstddef>
#include <vector>

namespace loopcalc {

/**
 * @brief One node of the condensed graph (a strongly connected component)
 */
struct Component {
    size_t id;                          ///< Position in AnalyzedGraph::components
    std::vector<size_t> members;        ///< Attribute indices, declaration order
    bool cyclic;                        ///< More than one member, or a self-loop
    std::vector<size_t> dependencies;   ///< Component ids this component reads, ascending
    size_t level;                       ///< 0 for components with no dependencies

    Component() : id(0), cyclic(false), level(0) {}
};

/**
 * @brief Condensed, levelled view of a dependency graph
 *
 * Components are numbered in topological order (level, then first member).
 * Components within one level have no edges between them and may be
 * evaluated concurrently; levels must run in order.
 */
struct AnalyzedGraph {
    std::vector<Component> components;
    std::vector<size_t> component_of;           ///< attribute index -> component id
    std::vector<std::vector<size_t>> levels;    ///< level -> component ids, ascending

    size_t cyclic_count() const;
};

/**
 * @brief Tarjan's strongly connected components, linear in nodes + edges
 *
 * Components are returned in reverse topological order of the condensed
 * graph (a component is emitted after every component it feeds). Members of
 * each component are sorted ascending.
 */
std::vector<std::vector<size_t>> find_strongly_connected_components(const DependencyGraph& graph);

/**
 * @brief Condense the graph, tag cyclic components and split into levels
 */
AnalyzedGraph analyze_graph(const DependencyGraph& graph);

} // namespace loopcalc

#endif // LOOPCALC_GRAPH_ANALYZER_HPP
