#include "model_registry.hpp"
#include <algorithm>

namespace loopcalc {

namespace {

void validate_name(const std::string& name, const std::string& what) {
    if (name.empty()) {
        throw DefinitionError(what + " name cannot be empty");
    }
    if (name.find('.') != std::string::npos) {
        throw DefinitionError(what + " name cannot contain '.': " + name);
    }
}

} // anonymous namespace

ModelRegistry::ModelRegistry(const std::string& version)
    : version_(version), sealed_(false) {
    if (version_.empty()) {
        throw DefinitionError("Model version cannot be empty");
    }
}

ModelRegistry ModelRegistry::from_definition(const ModelDefinition& definition) {
    ModelRegistry registry(definition.version);
    for (const auto& block : definition.blocks) {
        registry.define_block(block.name);
    }
    for (const auto& block : definition.blocks) {
        for (const auto& [name, spec] : block.attributes) {
            registry.define_attribute(block.name, name, spec);
        }
    }
    registry.seal();
    return registry;
}

void ModelRegistry::require_unsealed(const std::string& operation) const {
    if (sealed_) {
        throw RegistrySealedError("Cannot " + operation + ": model registry '" + version_ + "' is sealed");
    }
}

void ModelRegistry::define_block(const std::string& name) {
    require_unsealed("define block " + name);
    validate_name(name, "Block");

    if (block_index_.find(name) != block_index_.end()) {
        throw DuplicateBlockError("Duplicate block: " + name);
    }
    block_index_[name] = blocks_.size();
    blocks_.emplace_back(name);
}

std::string ModelRegistry::define_attribute(
    const std::string& block,
    const std::string& name,
    const AttributeSpec& spec
) {
    require_unsealed("define attribute " + block + "." + name);
    validate_name(name, "Attribute");

    auto block_it = block_index_.find(block);
    if (block_it == block_index_.end()) {
        throw UnknownBlockError("Attribute '" + name + "' references unknown block: " + block);
    }

    const std::string identity = qualify(block, name);
    if (attribute_index_.find(identity) != attribute_index_.end()) {
        throw DuplicateAttributeError("Duplicate attribute: " + identity);
    }

    Attribute attribute;
    attribute.identity = identity;
    attribute.block = block;
    attribute.name = name;
    attribute.kind = spec.kind;
    attribute.index = attributes_.size();

    if (spec.kind == AttributeKind::INPUT) {
        if (spec.formula) {
            throw UnexpectedFormulaError("Input attribute '" + identity + "' cannot have a formula");
        }
        if (spec.dependencies && !spec.dependencies->empty()) {
            throw UnexpectedFormulaError("Input attribute '" + identity + "' cannot declare dependencies");
        }
        if (!spec.default_value) {
            throw DefinitionError("Input attribute '" + identity + "' requires a default value");
        }
        attribute.default_value = *spec.default_value;
    } else {
        if (!spec.formula) {
            throw MissingFormulaError("Calculated attribute '" + identity + "' requires a formula");
        }
        if (!spec.dependencies) {
            throw MissingFormulaError(
                "Calculated attribute '" + identity + "' must declare its dependencies (use an empty list for none)"
            );
        }
        if (spec.default_value) {
            throw UnexpectedFormulaError("Calculated attribute '" + identity + "' cannot have a default value");
        }
        attribute.formula = spec.formula;

        for (const std::string& dep : *spec.dependencies) {
            if (dep.empty()) {
                throw DefinitionError("Empty dependency reference in " + identity);
            }
            std::string qualified = qualify_reference(dep, block);
            if (std::find(attribute.dependencies.begin(), attribute.dependencies.end(), qualified)
                == attribute.dependencies.end()) {
                attribute.dependencies.push_back(qualified);
            }
        }
    }

    attribute_index_[identity] = attribute.index;
    attributes_.push_back(std::move(attribute));
    blocks_[block_it->second].attributes.push_back(identity);

    return identity;
}

std::string ModelRegistry::define_input(const std::string& block, const std::string& name, double default_value) {
    return define_attribute(block, name, AttributeSpec::input(default_value));
}

std::string ModelRegistry::define_calculated(
    const std::string& block,
    const std::string& name,
    Formula formula,
    std::vector<std::string> dependencies
) {
    return define_attribute(block, name, AttributeSpec::calculated(std::move(formula), std::move(dependencies)));
}

void ModelRegistry::seal() {
    if (sealed_) {
        return;
    }

    // Forward references are legal until now; resolve them all in one pass
    for (auto& attribute : attributes_) {
        attribute.dependency_indices.clear();
        attribute.dependency_indices.reserve(attribute.dependencies.size());
        for (const std::string& dep : attribute.dependencies) {
            auto it = attribute_index_.find(dep);
            if (it == attribute_index_.end()) {
                throw UnknownDependencyError(
                    "Attribute '" + attribute.identity + "' depends on unknown attribute: " + dep
                );
            }
            attribute.dependency_indices.push_back(it->second);
        }
    }

    sealed_ = true;
}

const Attribute& ModelRegistry::resolve(const std::string& identity) const {
    auto it = attribute_index_.find(identity);
    if (it == attribute_index_.end()) {
        throw UnknownAttributeError("Unknown attribute: " + identity);
    }
    return attributes_[it->second];
}

bool ModelRegistry::contains(const std::string& identity) const {
    return attribute_index_.find(identity) != attribute_index_.end();
}

size_t ModelRegistry::index_of(const std::string& identity) const {
    return resolve(identity).index;
}

std::vector<std::string> ModelRegistry::input_identities() const {
    std::vector<std::string> inputs;
    for (const auto& attribute : attributes_) {
        if (attribute.is_input()) {
            inputs.push_back(attribute.identity);
        }
    }
    return inputs;
}

} // namespace loopcalc
