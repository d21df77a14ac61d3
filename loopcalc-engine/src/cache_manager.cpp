#include "cache_manager.hpp"
#include <exception>
#include <limits>

namespace loopcalc {

namespace {

std::string index_key(const std::string& model_version, const std::string& name) {
    return model_version + "|" + name;
}

} // anonymous namespace

CacheManager::CacheManager(size_t max_entries, size_t max_group_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries),
      max_group_entries_(max_group_entries == 0 ? 1 : max_group_entries),
      clock_(0),
      hits_(0),
      misses_(0),
      waits_(0),
      group_hits_(0),
      group_misses_(0),
      evictions_(0) {}

bool CacheManager::is_cacheable(const RunResult& result) {
    return result.status == RunState::DONE || result.status == RunState::EXHAUSTED;
}

// ============================================================================
// Scenario tier
// ============================================================================

RunResult CacheManager::copy_hit(const ScenarioEntry& entry) const {
    RunResult result = *entry.result;
    result.from_cache = true;
    return result;
}

std::optional<RunResult> CacheManager::get(const std::string& fingerprint) {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);

    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    it->second.last_used.store(++clock_);
    hits_++;
    return copy_hit(it->second);
}

void CacheManager::insert_entry_locked(const std::string& fingerprint, const RunResult& result) {
    // Entries are never mutated: a newer result replaces the pointer
    auto stored = std::make_shared<RunResult>(result);
    stored->from_cache = false;

    ScenarioEntry& entry = entries_[fingerprint];
    entry.result = std::move(stored);
    entry.last_used.store(++clock_);

    evict_lru_locked();
}

void CacheManager::evict_lru_locked() {
    while (entries_.size() > max_entries_) {
        auto oldest = entries_.end();
        uint64_t oldest_tick = std::numeric_limits<uint64_t>::max();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            uint64_t tick = it->second.last_used.load();
            if (tick < oldest_tick) {
                oldest_tick = tick;
                oldest = it;
            }
        }
        if (oldest == entries_.end()) {
            break;
        }
        entries_.erase(oldest);
        evictions_++;
    }
}

bool CacheManager::put(const std::string& fingerprint, const RunResult& result) {
    if (!is_cacheable(result)) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    insert_entry_locked(fingerprint, result);
    return true;
}

bool CacheManager::is_in_flight(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(flight_mutex_);
    return in_flight_.find(fingerprint) != in_flight_.end();
}

RunResult CacheManager::get_or_compute(const std::string& fingerprint, const std::function<RunResult()>& compute) {
    std::promise<RunResult> promise;

    while (true) {
        if (auto cached = get(fingerprint)) {
            return *cached;
        }

        std::unique_lock<std::mutex> flight_lock(flight_mutex_);

        // A leader may have finished between the lookup above and this lock
        {
            std::shared_lock<std::shared_mutex> entries_lock(entries_mutex_);
            auto it = entries_.find(fingerprint);
            if (it != entries_.end()) {
                it->second.last_used.store(++clock_);
                hits_++;
                return copy_hit(it->second);
            }
        }

        auto flight_it = in_flight_.find(fingerprint);
        if (flight_it == in_flight_.end()) {
            in_flight_[fingerprint] = promise.get_future().share();
            misses_++;
            break;
        }

        std::shared_future<RunResult> pending = flight_it->second;
        flight_lock.unlock();

        waits_++;
        RunResult result = pending.get();
        if (result.status == RunState::CANCELLED) {
            // A cancelled leader says nothing about this caller
            continue;
        }
        result.from_cache = true;
        return result;
    }

    RunResult result;
    try {
        result = compute();
    } catch (...) {
        {
            std::lock_guard<std::mutex> flight_lock(flight_mutex_);
            in_flight_.erase(fingerprint);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> flight_lock(flight_mutex_);
        if (is_cacheable(result)) {
            std::unique_lock<std::shared_mutex> entries_lock(entries_mutex_);
            insert_entry_locked(fingerprint, result);
        }
        in_flight_.erase(fingerprint);
    }
    promise.set_value(result);

    return result;
}

// ============================================================================
// Group tier
// ============================================================================

void CacheManager::update_group_lru(const std::string& key) {
    auto it = group_lru_map_.find(key);
    if (it != group_lru_map_.end()) {
        group_lru_list_.erase(it->second);
    }
    group_lru_list_.push_front(key);
    group_lru_map_[key] = group_lru_list_.begin();
}

void CacheManager::erase_group_locked(const std::string& key) {
    auto it = group_entries_.find(key);
    if (it == group_entries_.end()) {
        return;
    }

    for (const auto& input : it->second.upstream_inputs) {
        auto index_it = dependents_index_.find(index_key(it->second.model_version, input));
        if (index_it != dependents_index_.end()) {
            index_it->second.erase(key);
            if (index_it->second.empty()) {
                dependents_index_.erase(index_it);
            }
        }
    }

    auto lru_it = group_lru_map_.find(key);
    if (lru_it != group_lru_map_.end()) {
        group_lru_list_.erase(lru_it->second);
        group_lru_map_.erase(lru_it);
    }

    group_entries_.erase(it);
}

void CacheManager::evict_group_lru() {
    while (group_entries_.size() > max_group_entries_ && !group_lru_list_.empty()) {
        std::string key = group_lru_list_.back();
        erase_group_locked(key);
        evictions_++;
    }
}

std::optional<GroupCacheEntry> CacheManager::get_group(const std::string& key) {
    std::lock_guard<std::mutex> lock(group_mutex_);

    auto it = group_entries_.find(key);
    if (it == group_entries_.end()) {
        group_misses_++;
        return std::nullopt;
    }
    update_group_lru(key);
    group_hits_++;
    return it->second;
}

void CacheManager::put_group(const std::string& key, const GroupCacheEntry& entry) {
    std::lock_guard<std::mutex> lock(group_mutex_);

    erase_group_locked(key);

    group_entries_[key] = entry;
    for (const auto& input : entry.upstream_inputs) {
        dependents_index_[index_key(entry.model_version, input)].insert(key);
    }
    latest_group_values_[index_key(entry.model_version, entry.group_label)] = entry.values;

    update_group_lru(key);
    evict_group_lru();
}

std::optional<std::vector<double>> CacheManager::last_group_values(
    const std::string& model_version,
    const std::string& group_label
) const {
    std::lock_guard<std::mutex> lock(group_mutex_);

    auto it = latest_group_values_.find(index_key(model_version, group_label));
    if (it == latest_group_values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Invalidation
// ============================================================================

size_t CacheManager::invalidate_input(const std::string& model_version, const std::string& input_identity) {
    size_t removed = 0;

    {
        std::lock_guard<std::mutex> lock(group_mutex_);

        auto index_it = dependents_index_.find(index_key(model_version, input_identity));
        if (index_it != dependents_index_.end()) {
            // Copy: erase_group_locked edits the index
            std::set<std::string> keys = index_it->second;
            for (const auto& key : keys) {
                auto entry_it = group_entries_.find(key);
                if (entry_it != group_entries_.end()) {
                    latest_group_values_.erase(index_key(model_version, entry_it->second.group_label));
                }
                erase_group_locked(key);
                removed++;
            }
        }
    }

    // Every full snapshot of this version contains the input
    {
        std::unique_lock<std::shared_mutex> lock(entries_mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.result->model_version == model_version) {
                it = entries_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }

    return removed;
}

size_t CacheManager::invalidate_version(const std::string& model_version) {
    size_t removed = 0;

    {
        std::lock_guard<std::mutex> lock(group_mutex_);

        std::vector<std::string> keys;
        for (const auto& pair : group_entries_) {
            if (pair.second.model_version == model_version) {
                keys.push_back(pair.first);
            }
        }
        for (const auto& key : keys) {
            erase_group_locked(key);
            removed++;
        }

        const std::string prefix = model_version + "|";
        for (auto it = latest_group_values_.begin(); it != latest_group_values_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = latest_group_values_.erase(it);
            } else {
                ++it;
            }
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(entries_mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.result->model_version == model_version) {
                it = entries_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }

    return removed;
}

void CacheManager::clear() {
    {
        std::lock_guard<std::mutex> lock(group_mutex_);
        group_entries_.clear();
        group_lru_list_.clear();
        group_lru_map_.clear();
        dependents_index_.clear();
        latest_group_values_.clear();
    }
    {
        std::unique_lock<std::shared_mutex> lock(entries_mutex_);
        entries_.clear();
    }
}

CacheStats CacheManager::get_stats() const {
    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.single_flight_waits = waits_.load();
    stats.group_hits = group_hits_.load();
    stats.group_misses = group_misses_.load();
    stats.evictions = evictions_.load();

    {
        std::shared_lock<std::shared_mutex> lock(entries_mutex_);
        stats.entries_count = entries_.size();
    }
    {
        std::lock_guard<std::mutex> lock(group_mutex_);
        stats.group_entries_count = group_entries_.size();
    }

    return stats;
}

} // namespace loopcalc
