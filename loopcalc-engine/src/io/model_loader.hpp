#ifndef LOOPCALC_IO_MODEL_LOADER_HPP
#define LOOPCALC_IO_MODEL_LOADER_HPP

#include "../errors.hpp"
#include "../model_registry.hpp"
#include "../scenario_store.hpp"
#include <string>

namespace loopcalc {
namespace io {

/**
 * @brief Sealed registry and scenario store read from one model file
 */
struct LoadedModel {
    ModelRegistry registry;
    ScenarioStore scenarios;
    std::string description;
};

/**
 * @brief Loads a model from a JSON file
 *
 * Layout:
 *   {
 *     "version": "1",
 *     "description": "...",
 *     "blocks": {
 *       "Production": {
 *         "materialCost": { "type": "input", "value": 120 },
 *         "disposalCost": { "type": "calculated",
 *                           "dependencies": ["materialCost", "co2Cost"],
 *                           "formula": { "kind": "linear",
 *                                        "terms": { "materialCost": 0.8, "co2Cost": 1.0 } } }
 *       }
 *     },
 *     "scenarios": {
 *       "HighEnergyPrices": { "Production": { "energyCost": 90 } },
 *       "Flat": { "Production.energyCost": 70 }
 *     }
 *   }
 *
 * Formula kinds: linear (constant, terms), product (coefficient), min, max.
 * Numeric values may be given as "${VAR}" strings, expanded from the environment.
 *
 * @param file_path Path to the JSON model file
 * @return Loaded model with a sealed registry and store
 * @throws ModelParseError if the file cannot be read or is malformed
 * @throws DefinitionError (or a subclass) if the model is invalid
 */
LoadedModel load_model_from_file(const std::string& file_path);

/**
 * @brief Loads a model from a JSON string
 *
 * @throws ModelParseError if the JSON is malformed
 * @throws DefinitionError (or a subclass) if the model is invalid
 */
LoadedModel load_model_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

} // namespace io
} // namespace loopcalc

#endif // LOOPCALC_IO_MODEL_LOADER_HPP
