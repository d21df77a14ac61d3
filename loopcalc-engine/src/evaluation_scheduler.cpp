/**
 * @file evaluation_scheduler.cpp
 * @brief Implementation of EvaluationScheduler
 */

#include "evaluation_scheduler.hpp"
#include "fingerprint.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace loopcalc {

EvaluationScheduler::EvaluationScheduler(
    const ModelRegistry& registry,
    const DependencyGraph& graph,
    const AnalyzedGraph& analysis,
    Logger* logger
)
    : registry_(registry),
      graph_(graph),
      analysis_(analysis),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }

    if (graph_.node_count != registry_.size() || analysis_.component_of.size() != registry_.size()) {
        throw std::invalid_argument("EvaluationScheduler: graph does not match model registry");
    }

    plans_.resize(analysis_.components.size());
    for (const auto& component : analysis_.components) {
        if (!component.cyclic) {
            continue;
        }
        GroupPlan& plan = plans_[component.id];
        for (size_t node : component.members) {
            const std::string& identity = registry_.at(node).identity;
            if (!plan.label.empty()) {
                plan.label += "|";
            }
            plan.label += identity;
            plan.members.push_back(identity);
        }
        for (size_t node : upstream_closure(graph_, component.members)) {
            if (registry_.at(node).is_input()) {
                plan.upstream_input_nodes.push_back(node);
                plan.upstream_inputs.push_back(registry_.at(node).identity);
            }
        }
    }
}

const std::vector<std::string>& EvaluationScheduler::upstream_inputs(size_t component_id) const {
    return plans_.at(component_id).upstream_inputs;
}

double EvaluationScheduler::evaluate_attribute(size_t node, const std::vector<double>& values, size_t iteration) const {
    const Attribute& attribute = registry_.at(node);
    DependencySnapshot snapshot(attribute, values);

    double value;
    try {
        value = attribute.formula(snapshot);
    } catch (const FormulaEvaluationError&) {
        throw;
    } catch (const std::exception& e) {
        throw FormulaEvaluationError(attribute.identity, iteration, e.what());
    }

    if (std::isnan(value)) {
        throw FormulaEvaluationError(attribute.identity, iteration, "result is NaN");
    }
    if (!std::isfinite(value)) {
        throw FormulaEvaluationError(attribute.identity, iteration, "result is infinite");
    }
    return value;
}

void EvaluationScheduler::solve_group(
    const Component& component,
    const GroupPlan& plan,
    std::vector<double>& values,
    const RunOptions& options,
    const LogContext& ctx,
    CacheManager* cache,
    ComponentOutcome& outcome
) const {
    GroupDiagnostics& diagnostics = outcome.diagnostics;
    diagnostics.members = plan.members;

    LogContext group_ctx = ctx;
    group_ctx.group = plan.label;
    group_ctx.phase = "solve";

    const bool use_cache = cache != nullptr && options.use_cache;
    std::string key;

    if (use_cache) {
        std::vector<std::pair<std::string, double>> upstream;
        upstream.reserve(plan.upstream_input_nodes.size());
        for (size_t i = 0; i < plan.upstream_input_nodes.size(); ++i) {
            upstream.emplace_back(plan.upstream_inputs[i], values[plan.upstream_input_nodes[i]]);
        }
        key = group_fingerprint(registry_.version(), plan.members, upstream, options);

        if (auto hit = cache->get_group(key)) {
            for (size_t i = 0; i < component.members.size(); ++i) {
                values[component.members[i]] = hit->values[i];
            }
            diagnostics = hit->diagnostics;
            diagnostics.from_cache = true;
            logger_->log_cache_hit(group_ctx, "group");
            return;
        }
    }

    // Initial guess: zero, or the group's last cached values when warm-starting
    std::vector<double> initial(component.members.size(), 0.0);
    if (use_cache && options.warm_start) {
        auto last = cache->last_group_values(registry_.version(), plan.label);
        if (last && last->size() == initial.size()) {
            initial = *last;
        }
    }
    for (size_t i = 0; i < component.members.size(); ++i) {
        values[component.members[i]] = initial[i];
    }

    std::vector<double> previous(component.members.size(), 0.0);

    for (size_t iteration = 1; iteration <= options.max_iterations; ++iteration) {
        if (options.cancelled() || options.past_deadline()) {
            diagnostics.cancelled = true;
            diagnostics.converged = false;
            outcome.cancelled = true;
            logger_->log_group_result(group_ctx, diagnostics);
            return;
        }

        group_ctx.iteration = iteration;

        for (size_t i = 0; i < component.members.size(); ++i) {
            previous[i] = values[component.members[i]];
        }

        // Gauss-Seidel: each update is visible to the members after it
        for (size_t node : component.members) {
            values[node] = evaluate_attribute(node, values, iteration);
        }

        double max_delta = 0.0;
        for (size_t i = 0; i < component.members.size(); ++i) {
            max_delta = std::max(max_delta, std::fabs(values[component.members[i]] - previous[i]));
        }

        diagnostics.iterations = iteration;
        diagnostics.max_delta = max_delta;

        if (max_delta < options.threshold) {
            diagnostics.converged = true;
            break;
        }
    }

    logger_->log_group_result(group_ctx, diagnostics);

    if (use_cache) {
        GroupCacheEntry entry;
        entry.model_version = registry_.version();
        entry.group_label = plan.label;
        entry.upstream_inputs = plan.upstream_inputs;
        entry.diagnostics = diagnostics;
        entry.values.reserve(component.members.size());
        for (size_t node : component.members) {
            entry.values.push_back(values[node]);
        }
        outcome.cache_entry = std::make_pair(key, std::move(entry));
    }
}

EvaluationScheduler::ComponentOutcome EvaluationScheduler::evaluate_component(
    size_t component_id,
    std::vector<double>& values,
    const RunOptions& options,
    const LogContext& ctx,
    CacheManager* cache
) const {
    ComponentOutcome outcome;
    const Component& component = analysis_.components[component_id];
    outcome.cyclic = component.cyclic;

    // Runs on a worker thread: hand every failure back to the level barrier
    try {
        if (component.cyclic) {
            solve_group(component, plans_[component_id], values, options, ctx, cache, outcome);
        } else {
            size_t node = component.members.front();
            if (registry_.at(node).is_calculated()) {
                values[node] = evaluate_attribute(node, values, 0);
            }
        }
    } catch (...) {
        outcome.error = std::current_exception();
    }

    return outcome;
}

RunResult EvaluationScheduler::run(
    const ResolvedInputs& inputs,
    const RunOptions& options,
    const LogContext& ctx,
    CacheManager* cache
) const {
    options.validate();

    auto start_time = std::chrono::steady_clock::now();

    RunResult result;
    result.scenario = ctx.scenario;
    result.fingerprint = ctx.fingerprint;
    result.model_version = registry_.version();

    LogContext run_ctx = ctx;
    run_ctx.phase = "schedule";

    RunState state = RunState::INITIALIZING;
    result.state_trace.push_back(state);

    auto transition = [&](RunState next) {
        logger_->log_state_transition(run_ctx, state, next);
        state = next;
        result.state_trace.push_back(next);
    };

    auto finish = [&](RunState final_state) {
        transition(final_state);
        result.status = final_state;
        if (final_state == RunState::FAILED || final_state == RunState::CANCELLED) {
            result.values.clear();
        }
        auto end_time = std::chrono::steady_clock::now();
        result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        return result;
    };

    // Initializing: bind every input
    std::vector<double> values(registry_.size(), 0.0);
    for (const auto& attribute : registry_.attributes()) {
        if (!attribute.is_input()) {
            continue;
        }
        auto it = inputs.find(attribute.identity);
        if (it == inputs.end()) {
            throw DefinitionError("No resolved value for input attribute: " + attribute.identity);
        }
        values[attribute.index] = it->second;
    }

    std::vector<std::pair<std::string, GroupCacheEntry>> solved_groups;

    try {
        for (size_t level = 0; level < analysis_.levels.size(); ++level) {
            // Cancellation point between levels
            if (options.cancelled() || options.past_deadline()) {
                logger_->log_warning(run_ctx, "Run cancelled before level " + std::to_string(level));
                return finish(RunState::CANCELLED);
            }

            auto level_start = std::chrono::steady_clock::now();
            const std::vector<size_t>& components = analysis_.levels[level];

            transition(RunState::LEVEL_PROCESSING);

            size_t cyclic_in_level = 0;
            for (size_t component_id : components) {
                if (analysis_.components[component_id].cyclic) {
                    cyclic_in_level++;
                }
            }
            if (cyclic_in_level > 0) {
                transition(RunState::CONVERGING);
            }

            std::vector<ComponentOutcome> outcomes(components.size());
            const long count = static_cast<long>(components.size());

#ifdef HAVE_OPENMP
            if (options.parallel && count > 1) {
                // Components of one level touch disjoint attributes; the loop end is the barrier
                #pragma omp parallel for schedule(dynamic, 1)
                for (long i = 0; i < count; ++i) {
                    outcomes[i] = evaluate_component(components[i], values, options, run_ctx, cache);
                }
            } else {
                for (long i = 0; i < count; ++i) {
                    outcomes[i] = evaluate_component(components[i], values, options, run_ctx, cache);
                }
            }
#else
            for (long i = 0; i < count; ++i) {
                outcomes[i] = evaluate_component(components[i], values, options, run_ctx, cache);
            }
#endif

            // First failure in level order wins, whichever thread hit it first
            bool cancelled = false;
            for (auto& outcome : outcomes) {
                if (outcome.error) {
                    std::rethrow_exception(outcome.error);
                }
                if (outcome.cyclic) {
                    result.diagnostics.per_group.push_back(outcome.diagnostics);
                }
                if (outcome.cache_entry) {
                    solved_groups.push_back(std::move(*outcome.cache_entry));
                }
                cancelled = cancelled || outcome.cancelled;
            }

            auto level_end = std::chrono::steady_clock::now();
            logger_->log_level_complete(
                run_ctx,
                level,
                components.size(),
                cyclic_in_level,
                std::chrono::duration<double, std::milli>(level_end - level_start).count()
            );

            if (cancelled) {
                logger_->log_warning(run_ctx, "Run cancelled during level " + std::to_string(level));
                return finish(RunState::CANCELLED);
            }
        }
    } catch (const FormulaEvaluationError& e) {
        result.error_message = e.what();
        result.failed_attribute = e.attribute();
        result.failed_iteration = e.iteration();
        logger_->log_error(run_ctx, e.what());
        return finish(RunState::FAILED);
    }

    for (const auto& attribute : registry_.attributes()) {
        result.values[attribute.identity] = values[attribute.index];
    }

    // Failed and cancelled runs return above without touching the group tier
    for (const auto& solved : solved_groups) {
        cache->put_group(solved.first, solved.second);
    }

    return finish(result.diagnostics.all_converged() ? RunState::DONE : RunState::EXHAUSTED);
}

} // namespace loopcalc
