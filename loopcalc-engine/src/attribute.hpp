#ifndef LOOPCALC_ATTRIBUTE_HPP
#define LOOPCALC_ATTRIBUTE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace loopcalc {

enum class AttributeKind : uint8_t {
    INPUT = 0,
    CALCULATED = 1
};

inline std::string kind_to_string(AttributeKind kind) {
    return kind == AttributeKind::INPUT ? "input" : "calculated";
}

struct Attribute;

// Read-only view over the values of one attribute's declared dependencies.
// Names may be given short ("co2Cost", resolved in the attribute's own block)
// or qualified ("Production.co2Cost"). Reading an undeclared name throws
// std::out_of_range.
class DependencySnapshot {
public:
    DependencySnapshot(const Attribute& attribute, const std::vector<double>& values);

    double get(const std::string& name) const;
    double operator[](const std::string& name) const { return get(name); }

    // Value of the i-th declared dependency, in declaration order
    double at(size_t i) const;

    size_t size() const;
    const std::vector<std::string>& names() const;
    const std::string& owner() const;

private:
    const Attribute* attribute_;
    const std::vector<double>* values_;
};

// Formulas are pure functions of their dependency snapshot
using Formula = std::function<double(const DependencySnapshot&)>;

// Definition-time description of an attribute, before qualification.
// dependencies is optional so that "declared empty" differs from "not declared".
struct AttributeSpec {
    AttributeKind kind;
    std::optional<double> default_value;
    Formula formula;
    std::optional<std::vector<std::string>> dependencies;

    AttributeSpec();

    static AttributeSpec input(double default_value);
    static AttributeSpec calculated(Formula formula, std::vector<std::string> dependencies);
};

struct Attribute {
    std::string identity;                       // "Block.name"
    std::string block;
    std::string name;
    AttributeKind kind;
    double default_value;                       // inputs only
    Formula formula;                            // calculated only
    std::vector<std::string> dependencies;      // qualified identities, declaration order
    std::vector<size_t> dependency_indices;     // filled by ModelRegistry::seal()
    size_t index;                               // declaration order within the model

    Attribute();

    bool is_input() const { return kind == AttributeKind::INPUT; }
    bool is_calculated() const { return kind == AttributeKind::CALCULATED; }
};

struct Block {
    std::string name;
    std::vector<std::string> attributes;  // identities, declaration order

    Block() = default;
    explicit Block(const std::string& name_) : name(name_) {}
};

// "Block.name" for a block and attribute name
std::string qualify(const std::string& block, const std::string& name);

// Qualify a dependency reference relative to the declaring block.
// Already-qualified references are returned unchanged.
std::string qualify_reference(const std::string& reference, const std::string& owner_block);

// Split "Block.name"; throws std::invalid_argument if not qualified
std::pair<std::string, std::string> split_identity(const std::string& identity);

} // namespace loopcalc

#endif // LOOPCALC_ATTRIBUTE_HPP
