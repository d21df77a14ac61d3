#ifndef LOOPCALC_MODEL_REGISTRY_HPP
#define LOOPCALC_MODEL_REGISTRY_HPP

#include "attribute.hpp"
#include "errors.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace loopcalc {

/**
 * @brief Declarative description of one block, consumed by ModelRegistry::from_definition
 */
struct BlockDefinition {
    std::string name;
    std::vector<std::pair<std::string, AttributeSpec>> attributes;  // declaration order

    BlockDefinition() = default;
    explicit BlockDefinition(const std::string& name_) : name(name_) {}
};

/**
 * @brief Declarative description of a whole model
 */
struct ModelDefinition {
    std::string version;
    std::string description;
    std::vector<BlockDefinition> blocks;

    ModelDefinition() : version("1") {}
};

/**
 * @brief Holds Block and Attribute definitions for one model version
 *
 * Definitions are loaded first (forward references allowed), then seal()
 * validates every dependency and freezes the registry. A sealed registry is
 * read-only and safe for concurrent reads; a new model version requires a
 * new registry.
 *
 * Usage Example:
 *   @code
 *   ModelRegistry registry("v1");
 *   registry.define_block("Production");
 *   registry.define_input("Production", "materialCost", 120.0);
 *   registry.define_calculated("Production", "disposalCost",
 *       [](const DependencySnapshot& s) { return s["materialCost"] * 0.8; },
 *       {"materialCost"});
 *   registry.seal();
 *   @endcode
 */
class ModelRegistry {
public:
    explicit ModelRegistry(const std::string& version = "1");

    ModelRegistry(ModelRegistry&&) noexcept = default;
    ModelRegistry& operator=(ModelRegistry&&) noexcept = default;
    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    /**
     * @brief Build and seal a registry from a declarative definition
     *
     * @throws DefinitionError (or a subclass) if any definition is invalid
     */
    static ModelRegistry from_definition(const ModelDefinition& definition);

    /**
     * @brief Declare a block
     *
     * @throws DuplicateBlockError if the name is taken
     * @throws RegistrySealedError after seal()
     */
    void define_block(const std::string& name);

    /**
     * @brief Declare an attribute inside an existing block
     *
     * Dependencies may be short names (same block) or qualified identities.
     * Their existence is checked by seal(), not here.
     *
     * @return Qualified identity "block.name"
     * @throws UnknownBlockError, DuplicateAttributeError, MissingFormulaError,
     *         UnexpectedFormulaError, RegistrySealedError
     */
    std::string define_attribute(const std::string& block, const std::string& name, const AttributeSpec& spec);

    std::string define_input(const std::string& block, const std::string& name, double default_value);

    std::string define_calculated(
        const std::string& block,
        const std::string& name,
        Formula formula,
        std::vector<std::string> dependencies
    );

    /**
     * @brief Validate all dependencies and freeze the registry
     *
     * @throws UnknownDependencyError if a declared dependency does not exist
     */
    void seal();

    bool is_sealed() const { return sealed_; }
    const std::string& version() const { return version_; }

    /**
     * @brief Look up an attribute by qualified identity
     *
     * @throws UnknownAttributeError if no such attribute exists
     */
    const Attribute& resolve(const std::string& identity) const;

    const Attribute& at(size_t index) const { return attributes_.at(index); }
    bool contains(const std::string& identity) const;
    size_t index_of(const std::string& identity) const;

    size_t size() const { return attributes_.size(); }
    const std::vector<Attribute>& attributes() const { return attributes_; }
    const std::vector<Block>& blocks() const { return blocks_; }

    // Input identities in declaration order
    std::vector<std::string> input_identities() const;

private:
    std::string version_;
    bool sealed_;
    std::vector<Block> blocks_;
    std::map<std::string, size_t> block_index_;
    std::vector<Attribute> attributes_;
    std::map<std::string, size_t> attribute_index_;

    void require_unsealed(const std::string& operation) const;
};

} // namespace loopcalc

#endif // LOOPCALC_MODEL_REGISTRY_HPP
