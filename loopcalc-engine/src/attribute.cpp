#include "attribute.hpp"
#include <stdexcept>

namespace loopcalc {

// ============================================================================
// DependencySnapshot Implementation
// ============================================================================

DependencySnapshot::DependencySnapshot(const Attribute& attribute, const std::vector<double>& values)
    : attribute_(&attribute), values_(&values) {}

double DependencySnapshot::get(const std::string& name) const {
    const std::string identity = qualify_reference(name, attribute_->block);
    const auto& deps = attribute_->dependencies;
    for (size_t i = 0; i < deps.size(); ++i) {
        if (deps[i] == identity) {
            return (*values_)[attribute_->dependency_indices[i]];
        }
    }
    throw std::out_of_range("'" + name + "' is not a declared dependency of " + attribute_->identity);
}

double DependencySnapshot::at(size_t i) const {
    if (i >= attribute_->dependency_indices.size()) {
        throw std::out_of_range("Dependency index out of range for " + attribute_->identity);
    }
    return (*values_)[attribute_->dependency_indices[i]];
}

size_t DependencySnapshot::size() const {
    return attribute_->dependencies.size();
}

const std::vector<std::string>& DependencySnapshot::names() const {
    return attribute_->dependencies;
}

const std::string& DependencySnapshot::owner() const {
    return attribute_->identity;
}

// ============================================================================
// AttributeSpec / Attribute Implementation
// ============================================================================

AttributeSpec::AttributeSpec()
    : kind(AttributeKind::INPUT) {}

AttributeSpec AttributeSpec::input(double default_value) {
    AttributeSpec spec;
    spec.kind = AttributeKind::INPUT;
    spec.default_value = default_value;
    return spec;
}

AttributeSpec AttributeSpec::calculated(Formula formula, std::vector<std::string> dependencies) {
    AttributeSpec spec;
    spec.kind = AttributeKind::CALCULATED;
    spec.formula = std::move(formula);
    spec.dependencies = std::move(dependencies);
    return spec;
}

Attribute::Attribute()
    : kind(AttributeKind::INPUT), default_value(0.0), index(0) {}

// ============================================================================
// Identity helpers
// ============================================================================

std::string qualify(const std::string& block, const std::string& name) {
    return block + "." + name;
}

std::string qualify_reference(const std::string& reference, const std::string& owner_block) {
    if (reference.find('.') != std::string::npos) {
        return reference;
    }
    return qualify(owner_block, reference);
}

std::pair<std::string, std::string> split_identity(const std::string& identity) {
    size_t dot_pos = identity.find('.');
    if (dot_pos == std::string::npos || dot_pos == 0 || dot_pos + 1 == identity.size()) {
        throw std::invalid_argument("Attribute identity must be 'Block.name': " + identity);
    }
    return {identity.substr(0, dot_pos), identity.substr(dot_pos + 1)};
}

} // namespace loopcalc
