#include "graph_analyzer.hpp"
#include <algorithm>
#include <limits>
#include <set>

namespace loopcalc {

size_t AnalyzedGraph::cyclic_count() const {
    return static_cast<size_t>(std::count_if(components.begin(), components.end(),
        [](const Component& c) { return c.cyclic; }));
}

std::vector<std::vector<size_t>> find_strongly_connected_components(const DependencyGraph& graph) {
    constexpr size_t UNVISITED = std::numeric_limits<size_t>::max();

    std::vector<size_t> index(graph.node_count, UNVISITED);
    std::vector<size_t> lowlink(graph.node_count, 0);
    std::vector<bool> on_stack(graph.node_count, false);
    std::vector<size_t> stack;
    stack.reserve(graph.node_count);

    std::vector<std::vector<size_t>> components;
    size_t next_index = 0;

    // Explicit work stack: chains may be far deeper than the call stack
    struct Frame {
        size_t node;
        size_t next_edge;
    };
    std::vector<Frame> work;

    auto visit = [&](size_t v) {
        index[v] = next_index;
        lowlink[v] = next_index;
        next_index++;
        stack.push_back(v);
        on_stack[v] = true;
        work.push_back({v, 0});
    };

    for (size_t root = 0; root < graph.node_count; ++root) {
        if (index[root] != UNVISITED) {
            continue;
        }
        visit(root);

        while (!work.empty()) {
            size_t v = work.back().node;
            const std::vector<size_t>& out = graph.dependents[v];

            if (work.back().next_edge < out.size()) {
                size_t w = out[work.back().next_edge++];
                if (index[w] == UNVISITED) {
                    visit(w);
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            // v is the root of a component: pop it off
            if (lowlink[v] == index[v]) {
                std::vector<size_t> component;
                size_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != v);
                std::sort(component.begin(), component.end());
                components.push_back(std::move(component));
            }

            work.pop_back();
            if (!work.empty()) {
                size_t parent = work.back().node;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
        }
    }

    return components;
}

AnalyzedGraph analyze_graph(const DependencyGraph& graph) {
    std::vector<std::vector<size_t>> sccs = find_strongly_connected_components(graph);

    // Tarjan emits sinks first; walk backwards to get dependencies before dependents
    std::reverse(sccs.begin(), sccs.end());

    std::vector<size_t> provisional_of(graph.node_count, 0);
    for (size_t c = 0; c < sccs.size(); ++c) {
        for (size_t node : sccs[c]) {
            provisional_of[node] = c;
        }
    }

    std::vector<size_t> level(sccs.size(), 0);
    std::vector<std::set<size_t>> provisional_deps(sccs.size());
    for (size_t c = 0; c < sccs.size(); ++c) {
        for (size_t node : sccs[c]) {
            for (size_t dep : graph.dependencies[node]) {
                size_t dep_component = provisional_of[dep];
                if (dep_component != c) {
                    provisional_deps[c].insert(dep_component);
                }
            }
        }
        for (size_t dep_component : provisional_deps[c]) {
            level[c] = std::max(level[c], level[dep_component] + 1);
        }
    }

    // Renumber: by level, then by first (lowest) member for determinism
    std::vector<size_t> order(sccs.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (level[a] != level[b]) {
            return level[a] < level[b];
        }
        return sccs[a].front() < sccs[b].front();
    });

    std::vector<size_t> final_id(sccs.size(), 0);
    for (size_t i = 0; i < order.size(); ++i) {
        final_id[order[i]] = i;
    }

    AnalyzedGraph analyzed;
    analyzed.component_of.assign(graph.node_count, 0);
    analyzed.components.resize(sccs.size());

    for (size_t i = 0; i < order.size(); ++i) {
        size_t c = order[i];
        Component& component = analyzed.components[i];
        component.id = i;
        component.members = sccs[c];
        component.level = level[c];
        component.cyclic = component.members.size() > 1 || graph.self_loop[component.members.front()];

        for (size_t dep_component : provisional_deps[c]) {
            component.dependencies.push_back(final_id[dep_component]);
        }
        std::sort(component.dependencies.begin(), component.dependencies.end());

        for (size_t node : component.members) {
            analyzed.component_of[node] = i;
        }

        if (analyzed.levels.size() <= component.level) {
            analyzed.levels.resize(component.level + 1);
        }
        analyzed.levels[component.level].push_back(i);
    }

    return analyzed;
}

} // namespace loopcalc
