#ifndef LOOPCALC_ERRORS_HPP
#define LOOPCALC_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace loopcalc {

/**
 * @brief Base exception for all LoopCalc errors
 */
class LoopCalcError : public std::runtime_error {
public:
    explicit LoopCalcError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised while a model or scenario set is being defined or validated
 *
 * Definition errors are fatal: the registry, store or engine being built
 * must not be used afterwards.
 */
class DefinitionError : public LoopCalcError {
public:
    explicit DefinitionError(const std::string& message)
        : LoopCalcError(message) {}
};

class DuplicateBlockError : public DefinitionError {
public:
    explicit DuplicateBlockError(const std::string& message)
        : DefinitionError(message) {}
};

class DuplicateAttributeError : public DefinitionError {
public:
    explicit DuplicateAttributeError(const std::string& message)
        : DefinitionError(message) {}
};

class UnknownBlockError : public DefinitionError {
public:
    explicit UnknownBlockError(const std::string& message)
        : DefinitionError(message) {}
};

class UnknownAttributeError : public DefinitionError {
public:
    explicit UnknownAttributeError(const std::string& message)
        : DefinitionError(message) {}
};

class UnknownDependencyError : public DefinitionError {
public:
    explicit UnknownDependencyError(const std::string& message)
        : DefinitionError(message) {}
};

/**
 * @brief Scenario override targets a calculated or unknown attribute
 */
class InvalidOverrideError : public DefinitionError {
public:
    explicit InvalidOverrideError(const std::string& message)
        : DefinitionError(message) {}
};

/**
 * @brief Calculated attribute lacks a formula or a dependency declaration
 */
class MissingFormulaError : public DefinitionError {
public:
    explicit MissingFormulaError(const std::string& message)
        : DefinitionError(message) {}
};

/**
 * @brief Input attribute carries a formula or dependencies
 */
class UnexpectedFormulaError : public DefinitionError {
public:
    explicit UnexpectedFormulaError(const std::string& message)
        : DefinitionError(message) {}
};

class UnknownScenarioError : public DefinitionError {
public:
    explicit UnknownScenarioError(const std::string& message)
        : DefinitionError(message) {}
};

/**
 * @brief Mutation attempted on a sealed registry or store
 */
class RegistrySealedError : public DefinitionError {
public:
    explicit RegistrySealedError(const std::string& message)
        : DefinitionError(message) {}
};

/**
 * @brief A formula threw, or produced a NaN or infinite value
 *
 * Scoped to one run. Carries the offending attribute identity and the solver
 * iteration (0 for attributes outside a cyclic group).
 */
class FormulaEvaluationError : public LoopCalcError {
public:
    FormulaEvaluationError(const std::string& attribute, size_t iteration, const std::string& reason)
        : LoopCalcError("Formula evaluation failed for '" + attribute + "'" +
                        (iteration > 0 ? " at iteration " + std::to_string(iteration) : std::string()) +
                        ": " + reason),
          attribute_(attribute),
          iteration_(iteration) {}

    const std::string& attribute() const { return attribute_; }
    size_t iteration() const { return iteration_; }

private:
    std::string attribute_;
    size_t iteration_;
};

/**
 * @brief Malformed model file (JSON syntax, missing or mistyped fields)
 */
class ModelParseError : public LoopCalcError {
public:
    explicit ModelParseError(const std::string& message)
        : LoopCalcError(message) {}
};

} // namespace loopcalc

#endif // LOOPCALC_ERRORS_HPP
