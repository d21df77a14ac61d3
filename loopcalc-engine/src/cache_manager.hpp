#ifndef LOOPCALC_CACHE_MANAGER_HPP
#define LOOPCALC_CACHE_MANAGER_HPP

#include "run_result.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace loopcalc {

/**
 * Cache statistics
 */
struct CacheStats {
    size_t hits;                  // scenario-tier hits
    size_t misses;                // scenario-tier misses (computations started)
    size_t single_flight_waits;   // callers that waited on an in-flight computation
    size_t group_hits;
    size_t group_misses;
    size_t evictions;             // both tiers
    size_t entries_count;
    size_t group_entries_count;
};

/**
 * Converged values of one cyclic group for one set of upstream inputs
 */
struct GroupCacheEntry {
    std::string model_version;
    std::string group_label;                  // member identities joined with '|'
    std::vector<double> values;               // member order
    std::vector<std::string> upstream_inputs; // inputs the group transitively reads
    GroupDiagnostics diagnostics;
};

/**
 * Result cache shared by every run of every engine that points at it
 *
 * Tiers:
 * - Scenario tier: fingerprint -> immutable RunResult. A hit short-circuits
 *   the scheduler. Bounded, least-recently-used eviction. Lookups take a
 *   shared lock; writes an exclusive one.
 * - Group tier: group fingerprint -> converged group values. Lets a run
 *   reuse every cyclic group whose upstream inputs did not change.
 *
 * Single-flight: get_or_compute() runs at most one computation per
 * fingerprint; concurrent callers wait for its result. Failed or cancelled
 * results, and computations that throw, never populate the cache.
 *
 * Invalidation: a reverse-dependency index (input identity -> group entries
 * reading it) lets invalidate_input() drop only the group entries downstream
 * of that input.
 */
class CacheManager {
public:
    /**
     * Constructor
     * @param max_entries Scenario-tier capacity (default: 256)
     * @param max_group_entries Group-tier capacity (default: 4096)
     */
    explicit CacheManager(size_t max_entries = 256, size_t max_group_entries = 4096);

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    /**
     * Look up a scenario-tier entry
     * @return Copy of the cached result with from_cache set, or nullopt
     */
    std::optional<RunResult> get(const std::string& fingerprint);

    /**
     * Store a scenario-tier entry, replacing any previous one
     * @return false if the result is not cacheable (FAILED or CANCELLED)
     */
    bool put(const std::string& fingerprint, const RunResult& result);

    /**
     * Return the cached result, wait for an in-flight computation, or run
     * `compute` as the single leader for this fingerprint.
     *
     * Exceptions thrown by `compute` reach the leader and every waiter.
     * A waiter whose leader ends CANCELLED does not share that result: it
     * looks again and computes with its own `compute` if nothing is cached.
     */
    RunResult get_or_compute(const std::string& fingerprint, const std::function<RunResult()>& compute);

    bool is_in_flight(const std::string& fingerprint) const;

    std::optional<GroupCacheEntry> get_group(const std::string& key);
    void put_group(const std::string& key, const GroupCacheEntry& entry);

    /**
     * Most recently stored values of a group, whatever its inputs were
     */
    std::optional<std::vector<double>> last_group_values(
        const std::string& model_version,
        const std::string& group_label
    ) const;

    /**
     * Drop the group entries that read `input_identity` and every
     * scenario-tier entry of `model_version`
     * @return Number of entries removed
     */
    size_t invalidate_input(const std::string& model_version, const std::string& input_identity);

    /**
     * Drop everything cached for a model version
     * @return Number of entries removed
     */
    size_t invalidate_version(const std::string& model_version);

    void clear();

    CacheStats get_stats() const;

    static bool is_cacheable(const RunResult& result);

private:
    struct ScenarioEntry {
        std::shared_ptr<const RunResult> result;
        std::atomic<uint64_t> last_used;

        ScenarioEntry() : last_used(0) {}
    };

    size_t max_entries_;
    size_t max_group_entries_;

    // Scenario tier
    mutable std::shared_mutex entries_mutex_;
    std::map<std::string, ScenarioEntry> entries_;
    std::atomic<uint64_t> clock_;

    // Single-flight; lock order is flight_mutex_ then entries_mutex_
    mutable std::mutex flight_mutex_;
    std::map<std::string, std::shared_future<RunResult>> in_flight_;

    // Group tier with LRU tracking
    mutable std::mutex group_mutex_;
    std::map<std::string, GroupCacheEntry> group_entries_;
    std::list<std::string> group_lru_list_;
    std::map<std::string, std::list<std::string>::iterator> group_lru_map_;
    std::map<std::string, std::set<std::string>> dependents_index_;   // version|input -> group keys
    std::map<std::string, std::vector<double>> latest_group_values_;  // version|label -> values

    // Statistics
    std::atomic<size_t> hits_;
    std::atomic<size_t> misses_;
    std::atomic<size_t> waits_;
    std::atomic<size_t> group_hits_;
    std::atomic<size_t> group_misses_;
    std::atomic<size_t> evictions_;

    void insert_entry_locked(const std::string& fingerprint, const RunResult& result);
    void evict_lru_locked();
    RunResult copy_hit(const ScenarioEntry& entry) const;

    void update_group_lru(const std::string& key);
    void evict_group_lru();
    void erase_group_locked(const std::string& key);
};

} // namespace loopcalc

#endif // LOOPCALC_CACHE_MANAGER_HPP
