#include <catch2/catch_test_macros.hpp>
#include "../src/dependency_graph.hpp"
#include "stk_fixture.hpp"

using namespace loopcalc;

namespace {

// Node indices of the STK model, in declaration order
constexpr size_t MATERIAL = 0;
constexpr size_t ENERGY = 1;
constexpr size_t DISPOSAL = 2;
constexpr size_t CO2 = 3;
constexpr size_t TRANSPORT = 4;
constexpr size_t LOGISTICS = 5;
constexpr size_t ECO_FEES = 6;

} // anonymous namespace

TEST_CASE("Dependency graph has one node per attribute", "[dependency_graph]") {
    ModelRegistry registry = testing::build_stk_registry();
    DependencyGraph graph = build_dependency_graph(registry);

    REQUIRE(graph.node_count == 7);
    REQUIRE(graph.edge_count == 8);
    REQUIRE(registry.index_of("Logistics.ecoFees") == ECO_FEES);
}

TEST_CASE("Dependency graph edges run dependency to dependent", "[dependency_graph]") {
    ModelRegistry registry = testing::build_stk_registry();
    DependencyGraph graph = build_dependency_graph(registry);

    REQUIRE(graph.has_edge(MATERIAL, DISPOSAL));
    REQUIRE(graph.has_edge(CO2, DISPOSAL));
    REQUIRE(graph.has_edge(DISPOSAL, CO2));
    REQUIRE(graph.has_edge(CO2, ECO_FEES));
    REQUIRE_FALSE(graph.has_edge(DISPOSAL, MATERIAL));
    REQUIRE_FALSE(graph.has_edge(ECO_FEES, CO2));

    REQUIRE(graph.dependencies[ECO_FEES] == std::vector<size_t>{LOGISTICS, CO2});
    REQUIRE(graph.dependents[CO2] == std::vector<size_t>{DISPOSAL, ECO_FEES});
    REQUIRE(graph.dependencies[TRANSPORT].empty());
}

TEST_CASE("Every edge matches a declared dependency name", "[dependency_graph]") {
    ModelRegistry registry = testing::build_stk_registry();
    DependencyGraph graph = build_dependency_graph(registry);

    size_t declared = 0;
    for (const auto& attribute : registry.attributes()) {
        for (const auto& dependency : attribute.dependencies) {
            REQUIRE(graph.has_edge(registry.index_of(dependency), attribute.index));
            declared++;
        }
        REQUIRE(graph.dependencies[attribute.index].size() == attribute.dependencies.size());
    }
    REQUIRE(declared == graph.edge_count);
}

TEST_CASE("Dependency graph keeps self-dependencies", "[dependency_graph]") {
    ModelRegistry registry;
    registry.define_block("A");
    registry.define_input("A", "rate", 0.5);
    registry.define_calculated("A", "balance",
        [](const DependencySnapshot& s) { return 100.0 + s["balance"] * s["rate"]; },
        {"balance", "rate"});
    registry.seal();

    DependencyGraph graph = build_dependency_graph(registry);

    REQUIRE(graph.self_loop[1]);
    REQUIRE_FALSE(graph.self_loop[0]);
    REQUIRE(graph.has_edge(1, 1));
}

TEST_CASE("Dependency graph requires a sealed registry", "[dependency_graph][errors]") {
    ModelRegistry registry;
    registry.define_block("A");
    registry.define_input("A", "x", 1.0);

    REQUIRE_THROWS_AS(build_dependency_graph(registry), DefinitionError);
}

TEST_CASE("Downstream closure follows dependents transitively", "[dependency_graph]") {
    ModelRegistry registry = testing::build_stk_registry();
    DependencyGraph graph = build_dependency_graph(registry);

    SECTION("Energy feeds both loops") {
        REQUIRE(downstream_closure(graph, ENERGY) ==
                std::vector<size_t>{ENERGY, DISPOSAL, CO2, LOGISTICS, ECO_FEES});
    }

    SECTION("Transport feeds only the logistics loop") {
        REQUIRE(downstream_closure(graph, TRANSPORT) ==
                std::vector<size_t>{TRANSPORT, LOGISTICS, ECO_FEES});
    }
}

TEST_CASE("Upstream closure follows dependencies transitively", "[dependency_graph]") {
    ModelRegistry registry = testing::build_stk_registry();
    DependencyGraph graph = build_dependency_graph(registry);

    REQUIRE(upstream_closure(graph, {DISPOSAL, CO2}) ==
            std::vector<size_t>{MATERIAL, ENERGY, DISPOSAL, CO2});
    REQUIRE(upstream_closure(graph, {LOGISTICS, ECO_FEES}).size() == 7);
    REQUIRE(upstream_closure(graph, {MATERIAL}) == std::vector<size_t>{MATERIAL});
}
