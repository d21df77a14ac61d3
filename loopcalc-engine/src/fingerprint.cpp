#include "fingerprint.hpp"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace loopcalc {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

} // anonymous namespace

FingerprintBuilder::FingerprintBuilder()
    : hash_(FNV_OFFSET_BASIS) {}

void FingerprintBuilder::mix(const unsigned char* bytes, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        hash_ ^= bytes[i];
        hash_ *= FNV_PRIME;
    }
}

FingerprintBuilder& FingerprintBuilder::add(uint64_t value) {
    unsigned char bytes[sizeof(uint64_t)];
    // Little-endian regardless of host order
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
    }
    mix(bytes, sizeof(bytes));
    return *this;
}

FingerprintBuilder& FingerprintBuilder::add(const std::string& value) {
    add(static_cast<uint64_t>(value.size()));
    mix(reinterpret_cast<const unsigned char*>(value.data()), value.size());
    return *this;
}

FingerprintBuilder& FingerprintBuilder::add(double value) {
    // -0.0 and 0.0 are the same input
    if (value == 0.0) {
        value = 0.0;
    }
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return add(bits);
}

std::string FingerprintBuilder::hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << hash_;
    return oss.str();
}

std::string scenario_fingerprint(
    const std::string& model_version,
    const std::string& scenario,
    const ResolvedInputs& inputs,
    const RunOptions& options
) {
    FingerprintBuilder builder;
    builder.add(std::string("scenario"))
           .add(model_version)
           .add(scenario)
           .add(static_cast<uint64_t>(options.max_iterations))
           .add(options.threshold)
           .add(static_cast<uint64_t>(inputs.size()));

    // ResolvedInputs is ordered by identity, so iteration order is canonical
    for (const auto& [identity, value] : inputs) {
        builder.add(identity).add(value);
    }
    return builder.hex();
}

std::string group_fingerprint(
    const std::string& model_version,
    const std::vector<std::string>& members,
    const std::vector<std::pair<std::string, double>>& upstream_inputs,
    const RunOptions& options
) {
    FingerprintBuilder builder;
    builder.add(std::string("group"))
           .add(model_version)
           .add(static_cast<uint64_t>(options.max_iterations))
           .add(options.threshold)
           .add(static_cast<uint64_t>(members.size()));

    for (const auto& member : members) {
        builder.add(member);
    }
    builder.add(static_cast<uint64_t>(upstream_inputs.size()));
    for (const auto& [identity, value] : upstream_inputs) {
        builder.add(identity).add(value);
    }
    return builder.hex();
}

} // namespace loopcalc
