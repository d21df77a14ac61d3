#include "model_loader.hpp"
#include "../formulas.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>
#include <vector>

// ordered_json keeps blocks and attributes in file order, which is declaration order
using json = nlohmann::ordered_json;

namespace loopcalc {
namespace io {

namespace {

double parse_number(const json& value, const std::string& where) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        std::string text = expand_environment_variables(value.get<std::string>());
        size_t consumed = 0;
        double number = 0.0;
        try {
            number = std::stod(text, &consumed);
        } catch (const std::exception&) {
            throw ModelParseError(where + ": not a number: '" + text + "'");
        }
        if (consumed != text.size()) {
            throw ModelParseError(where + ": not a number: '" + text + "'");
        }
        return number;
    }
    throw ModelParseError(where + ": expected a number");
}

Formula parse_formula(const json& formula_json, const std::vector<std::string>& dependencies,
                      const std::string& block, const std::string& where) {
    if (!formula_json.is_object()) {
        throw ModelParseError(where + ": formula must be an object");
    }
    if (!formula_json.contains("kind")) {
        throw ModelParseError(where + ": formula missing required field: kind");
    }
    std::string kind = formula_json["kind"].get<std::string>();

    if (kind == "linear") {
        double constant = formula_json.contains("constant")
            ? parse_number(formula_json["constant"], where + ".constant")
            : 0.0;

        std::vector<std::pair<std::string, double>> terms;
        if (formula_json.contains("terms")) {
            for (auto it = formula_json["terms"].begin(); it != formula_json["terms"].end(); ++it) {
                // Every term must be a declared dependency
                std::string identity = qualify_reference(it.key(), block);
                bool declared = std::any_of(dependencies.begin(), dependencies.end(),
                    [&](const std::string& dep) { return qualify_reference(dep, block) == identity; });
                if (!declared) {
                    throw ModelParseError(where + ": term '" + it.key() + "' is not a declared dependency");
                }
                terms.emplace_back(it.key(), parse_number(it.value(), where + ".terms." + it.key()));
            }
        }
        return formulas::linear(constant, std::move(terms));
    }

    if (kind == "product") {
        double coefficient = formula_json.contains("coefficient")
            ? parse_number(formula_json["coefficient"], where + ".coefficient")
            : 1.0;
        return formulas::product(coefficient);
    }

    if (kind == "min" || kind == "max") {
        if (dependencies.empty()) {
            throw ModelParseError(where + ": '" + kind + "' formula needs at least one dependency");
        }
        return kind == "min" ? formulas::minimum() : formulas::maximum();
    }

    throw ModelParseError(where + ": unknown formula kind '" + kind + "'");
}

AttributeSpec parse_attribute(const json& attr_json, const std::string& block, const std::string& name) {
    const std::string where = block + "." + name;

    if (!attr_json.is_object()) {
        throw ModelParseError(where + ": attribute must be an object");
    }
    if (!attr_json.contains("type")) {
        throw ModelParseError(where + ": missing required field: type");
    }
    std::string type = attr_json["type"].get<std::string>();

    if (type == "input") {
        if (attr_json.contains("formula") || attr_json.contains("dependencies")) {
            throw UnexpectedFormulaError("Input attribute " + where + " must not declare a formula or dependencies");
        }
        if (!attr_json.contains("value")) {
            throw ModelParseError(where + ": input missing required field: value");
        }
        return AttributeSpec::input(parse_number(attr_json["value"], where + ".value"));
    }

    if (type == "calculated") {
        if (attr_json.contains("value")) {
            throw UnexpectedFormulaError("Calculated attribute " + where + " must not declare a value");
        }

        AttributeSpec spec;
        spec.kind = AttributeKind::CALCULATED;

        // Leave dependencies/formula unset when absent so the registry reports MissingFormula
        if (attr_json.contains("dependencies")) {
            std::vector<std::string> dependencies;
            for (const auto& dep : attr_json["dependencies"]) {
                dependencies.push_back(dep.get<std::string>());
            }
            spec.dependencies = dependencies;
        }
        if (attr_json.contains("formula")) {
            spec.formula = parse_formula(
                attr_json["formula"],
                spec.dependencies.value_or(std::vector<std::string>()),
                block,
                where
            );
        }
        return spec;
    }

    throw ModelParseError(where + ": unknown attribute type '" + type + "'");
}

std::map<std::string, double> parse_overrides(const json& scenario_json, const std::string& scenario) {
    if (!scenario_json.is_object()) {
        throw ModelParseError("Scenario '" + scenario + "' must be an object");
    }

    std::map<std::string, double> overrides;
    for (auto it = scenario_json.begin(); it != scenario_json.end(); ++it) {
        if (it.value().is_object()) {
            // Nested per block
            for (auto attr = it.value().begin(); attr != it.value().end(); ++attr) {
                std::string identity = qualify(it.key(), attr.key());
                overrides[identity] = parse_number(attr.value(), "Scenario '" + scenario + "' " + identity);
            }
        } else {
            overrides[it.key()] = parse_number(it.value(), "Scenario '" + scenario + "' " + it.key());
        }
    }
    return overrides;
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated reference: leave as is
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        // Get environment variable value
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        // Replace in string
        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

LoadedModel load_model_from_string(const std::string& json_string) {
    ModelDefinition definition;
    std::vector<std::pair<std::string, std::map<std::string, double>>> scenarios;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ModelParseError("Model must be a JSON object");
        }

        // Parse version (optional, string or number)
        if (j.contains("version")) {
            definition.version = j["version"].is_string()
                ? j["version"].get<std::string>()
                : j["version"].dump();
        }

        // Parse description (optional)
        if (j.contains("description")) {
            definition.description = j["description"].get<std::string>();
        }

        // Parse blocks (required)
        if (!j.contains("blocks")) {
            throw ModelParseError("Missing required field: blocks");
        }
        if (!j["blocks"].is_object()) {
            throw ModelParseError("Field 'blocks' must be an object");
        }

        for (auto block_it = j["blocks"].begin(); block_it != j["blocks"].end(); ++block_it) {
            BlockDefinition block(block_it.key());

            if (!block_it.value().is_object()) {
                throw ModelParseError("Block '" + block.name + "' must be an object");
            }
            for (auto attr_it = block_it.value().begin(); attr_it != block_it.value().end(); ++attr_it) {
                block.attributes.emplace_back(
                    attr_it.key(),
                    parse_attribute(attr_it.value(), block.name, attr_it.key())
                );
            }

            definition.blocks.push_back(std::move(block));
        }

        // Parse scenarios (optional)
        if (j.contains("scenarios")) {
            if (!j["scenarios"].is_object()) {
                throw ModelParseError("Field 'scenarios' must be an object");
            }
            for (auto it = j["scenarios"].begin(); it != j["scenarios"].end(); ++it) {
                scenarios.emplace_back(it.key(), parse_overrides(it.value(), it.key()));
            }
        }

    } catch (const json::parse_error& e) {
        throw ModelParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ModelParseError(std::string("JSON type error: ") + e.what());
    }

    LoadedModel model;
    model.description = definition.description;
    model.registry = ModelRegistry::from_definition(definition);

    for (const auto& [name, overrides] : scenarios) {
        model.scenarios.define_scenario(name, overrides);
    }
    model.scenarios.seal(model.registry);

    return model;
}

LoadedModel load_model_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ModelParseError("Failed to open model file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return load_model_from_string(buffer.str());
}

} // namespace io
} // namespace loopcalc
