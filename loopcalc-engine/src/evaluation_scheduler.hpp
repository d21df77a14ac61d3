/**
 * @file evaluation_scheduler.hpp
 * @brief Level-by-level evaluation of a condensed dependency graph
 *
 * The scheduler drives one run through the state machine
 * INITIALIZING -> LEVEL_PROCESSING -> (CONVERGING)* -> DONE | EXHAUSTED | FAILED | CANCELLED:
 * - Binds every input attribute from the resolved inputs
 * - Evaluates each topological level on the worker pool; the end of the
 *   level is a barrier
 * - Solves each cyclic group by Gauss-Seidel fixed-point iteration in
 *   declaration order: an update is visible to the members evaluated after
 *   it in the same iteration
 * - Reports per-group convergence diagnostics
 */

#ifndef LOOPCALC_EVALUATION_SCHEDULER_HPP
#define LOOPCALC_EVALUATION_SCHEDULER_HPP

#include "cache_manager.hpp"
#include "dependency_graph.hpp"
#include "graph_analyzer.hpp"
#include "logger.hpp"
#include "model_registry.hpp"
#include "run_result.hpp"
#include "scenario_store.hpp"
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace loopcalc {

class EvaluationScheduler {
public:
    /**
     * @brief Constructor
     *
     * The registry, graph and analysis must outlive the scheduler.
     *
     * @param logger Logger instance (optional, uses the singleton if nullptr)
     */
    EvaluationScheduler(
        const ModelRegistry& registry,
        const DependencyGraph& graph,
        const AnalyzedGraph& analysis,
        Logger* logger = nullptr
    );

    /**
     * @brief Evaluate every attribute for one set of resolved inputs
     *
     * Formula failures are returned as a FAILED result naming the attribute
     * and iteration; cancellation and deadlines as CANCELLED. Neither carries
     * values.
     *
     * @param inputs Value of every input attribute
     * @param options Solver and scheduling options
     * @param ctx Logging context of the run
     * @param cache Group-tier cache to consult and populate (optional).
     *              Groups are stored only when the run ends DONE or EXHAUSTED.
     * @throws std::invalid_argument on invalid options
     * @throws DefinitionError if an input attribute has no resolved value
     */
    RunResult run(
        const ResolvedInputs& inputs,
        const RunOptions& options,
        const LogContext& ctx = LogContext(),
        CacheManager* cache = nullptr
    ) const;

    const AnalyzedGraph& analysis() const { return analysis_; }

    /**
     * @brief Input identities a cyclic component transitively reads
     *
     * Empty for acyclic components.
     */
    const std::vector<std::string>& upstream_inputs(size_t component_id) const;

private:
    struct GroupPlan {
        std::vector<std::string> members;           // identities, update order
        std::string label;                          // members joined with '|'
        std::vector<std::string> upstream_inputs;   // identities, declaration order
        std::vector<size_t> upstream_input_nodes;
    };

    struct ComponentOutcome {
        bool cyclic;
        bool cancelled;
        GroupDiagnostics diagnostics;
        std::optional<std::pair<std::string, GroupCacheEntry>> cache_entry;   // stored once the run succeeds
        std::exception_ptr error;

        ComponentOutcome() : cyclic(false), cancelled(false) {}
    };

    const ModelRegistry& registry_;
    const DependencyGraph& graph_;
    const AnalyzedGraph& analysis_;
    Logger* logger_;
    std::vector<GroupPlan> plans_;   // indexed by component id

    double evaluate_attribute(size_t node, const std::vector<double>& values, size_t iteration) const;

    ComponentOutcome evaluate_component(
        size_t component_id,
        std::vector<double>& values,
        const RunOptions& options,
        const LogContext& ctx,
        CacheManager* cache
    ) const;

    void solve_group(
        const Component& component,
        const GroupPlan& plan,
        std::vector<double>& values,
        const RunOptions& options,
        const LogContext& ctx,
        CacheManager* cache,
        ComponentOutcome& outcome
    ) const;
};

} // namespace loopcalc

#endif // LOOPCALC_EVALUATION_SCHEDULER_HPP
