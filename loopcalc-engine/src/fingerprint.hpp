#ifndef LOOPCALC_FINGERPRINT_HPP
#define LOOPCALC_FINGERPRINT_HPP

#include "run_result.hpp"
#include "scenario_store.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace loopcalc {

// Incremental 64-bit FNV-1a over a canonical byte encoding.
// Strings are length-prefixed and doubles hashed by bit pattern, so distinct
// field sequences never collide by concatenation.
class FingerprintBuilder {
public:
    FingerprintBuilder();

    FingerprintBuilder& add(const std::string& value);
    FingerprintBuilder& add(double value);
    FingerprintBuilder& add(uint64_t value);

    uint64_t value() const { return hash_; }

    // 16 lowercase hex digits
    std::string hex() const;

private:
    uint64_t hash_;

    void mix(const unsigned char* bytes, size_t size);
};

// Key of a scenario-level cache entry: model version, scenario name, every
// resolved input, and the solver options that change the result.
std::string scenario_fingerprint(
    const std::string& model_version,
    const std::string& scenario,
    const ResolvedInputs& inputs,
    const RunOptions& options
);

// Key of a group-level cache entry: model version, group members, solver
// options, and the inputs upstream of the group with their values.
std::string group_fingerprint(
    const std::string& model_version,
    const std::vector<std::string>& members,
    const std::vector<std::pair<std::string, double>>& upstream_inputs,
    const RunOptions& options
);

} // namespace loopcalc

#endif // LOOPCALC_FINGERPRINT_HPP
