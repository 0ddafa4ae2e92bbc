#include "mtqdesign/config.hpp"

#include "mtqdesign/errors.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace mtqdesign {
namespace {

using nlohmann::json;

const json& requireGroup(const json& root, const std::string& name) {
    if (!root.contains(name)) {
        throw ConfigError("Configuration missing required group: " + name);
    }
    const auto& group = root.at(name);
    if (!group.is_object()) {
        throw ConfigError("Configuration group '" + name + "' must be an object");
    }
    return group;
}

double requireNumber(const json& group, const std::string& groupName, const std::string& key) {
    const std::string field = groupName + "." + key;
    if (!group.contains(key)) {
        throw ConfigError("Configuration missing required field: " + field);
    }
    const auto& value = group.at(key);
    if (!value.is_number()) {
        throw ConfigError(field + " must be a number");
    }
    const double number = value.get<double>();
    if (!std::isfinite(number)) {
        throw ConfigError(field + " must be finite");
    }
    return number;
}

double optionalNumber(const json& group, const std::string& groupName, const std::string& key,
                      double fallback) {
    if (!group.contains(key) || group.at(key).is_null()) {
        return fallback;
    }
    return requireNumber(group, groupName, key);
}

int requireInteger(const json& group, const std::string& groupName, const std::string& key) {
    const std::string field = groupName + "." + key;
    if (!group.contains(key)) {
        throw ConfigError("Configuration missing required field: " + field);
    }
    const auto& value = group.at(key);
    constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
    constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
    if (value.is_number_unsigned()) {
        if (value.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            throw ConfigError(field + " is out of range");
        }
        return static_cast<int>(value.get<unsigned long long>());
    }
    if (value.is_number_integer()) {
        const long long number = value.get<long long>();
        if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
            throw ConfigError(field + " is out of range");
        }
        return static_cast<int>(number);
    }
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::isfinite(number) && std::floor(number) == number) {
            if (number < kMin || number > kMax) {
                throw ConfigError(field + " is out of range");
            }
            return static_cast<int>(number);
        }
    }
    throw ConfigError(field + " must be an integer");
}

void requirePositive(const std::string& field, double value) {
    if (!(value > 0.0)) {
        throw ConfigError(field + " must be positive");
    }
}

DesignConfig parseConfigJson(const json& root) {
    if (!root.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    DesignConfig config{};

    const auto& physical = requireGroup(root, "physical_constants");
    config.physical.vacuumPermeability =
        optionalNumber(physical, "physical_constants", "vacuum_permeability", kDefaults.vacuumPermeability);
    config.physical.copperResistivity = requireNumber(physical, "physical_constants", "copper_resistivity");
    config.physical.temperatureCoefficient =
        requireNumber(physical, "physical_constants", "temperature_coefficient");
    config.physical.ozToM = requireNumber(physical, "physical_constants", "oz_to_m");
    config.physical.currentDensityLimit =
        requireNumber(physical, "physical_constants", "current_density_limit");

    const auto& thermal = requireGroup(root, "thermal_properties");
    config.thermal.thermalConductivityCopper =
        requireNumber(thermal, "thermal_properties", "thermal_conductivity_copper");
    config.thermal.thermalConductivityFr4 =
        requireNumber(thermal, "thermal_properties", "thermal_conductivity_fr4");
    config.thermal.fr4Thickness = requireNumber(thermal, "thermal_properties", "fr4_thickness");
    config.thermal.surfaceAreaMultiplier =
        requireNumber(thermal, "thermal_properties", "surface_area_multiplier");
    if (thermal.contains("convection_coefficient") && !thermal.at("convection_coefficient").is_null()) {
        config.thermal.convectionCoefficient =
            requireNumber(thermal, "thermal_properties", "convection_coefficient");
    }

    const auto& design = requireGroup(root, "design_constraints");
    config.design.numLayers = requireInteger(design, "design_constraints", "num_layers");
    config.design.copperWeight = requireNumber(design, "design_constraints", "copper_weight");
    config.design.maxPower = requireNumber(design, "design_constraints", "max_power");
    config.design.voltage = requireNumber(design, "design_constraints", "voltage");
    config.design.innerLength = requireNumber(design, "design_constraints", "inner_length");
    config.design.innerWidth = requireNumber(design, "design_constraints", "inner_width");
    config.design.outerLength = requireNumber(design, "design_constraints", "outer_length");
    config.design.outerWidth = requireNumber(design, "design_constraints", "outer_width");
    config.design.operatingTemp = requireNumber(design, "design_constraints", "operating_temp");
    config.design.ambientTemp = requireNumber(design, "design_constraints", "ambient_temp");

    const auto& manufacturing = requireGroup(root, "manufacturing_constraints");
    config.manufacturing.minTraceWidth =
        requireNumber(manufacturing, "manufacturing_constraints", "min_trace_width");
    config.manufacturing.maxTraceWidth =
        requireNumber(manufacturing, "manufacturing_constraints", "max_trace_width");
    config.manufacturing.minTraceSpacing =
        requireNumber(manufacturing, "manufacturing_constraints", "min_trace_spacing");

    if (root.contains("model_options")) {
        const auto& model = requireGroup(root, "model_options");
        if (model.contains("inductance_formula")) {
            const auto& formula = model.at("inductance_formula");
            if (!formula.is_string()) {
                throw ConfigError("model_options.inductance_formula must be a string");
            }
            config.model.inductanceFormula = parseInductanceFormula(formula.get<std::string>());
        }
        config.model.emissivity = optionalNumber(model, "model_options", "emissivity", kDefaults.emissivity);
        config.model.spaceAmbientTemp =
            optionalNumber(model, "model_options", "space_ambient_temp", kDefaults.spaceAmbientTemp);
        config.model.referenceTemp =
            optionalNumber(model, "model_options", "reference_temp", kDefaults.referenceTemp);
        if (model.contains("scale_resistance_with_temperature")) {
            const auto& flag = model.at("scale_resistance_with_temperature");
            if (!flag.is_boolean()) {
                throw ConfigError("model_options.scale_resistance_with_temperature must be a boolean");
            }
            config.model.scaleResistanceWithTemperature = flag.get<bool>();
        }
        if (model.contains("thermal_max_iterations")) {
            const int iters = requireInteger(model, "model_options", "thermal_max_iterations");
            if (iters <= 0) {
                throw ConfigError("model_options.thermal_max_iterations must be positive");
            }
            config.model.thermalMaxIterations = static_cast<std::size_t>(iters);
        }
        config.model.thermalTolerance =
            optionalNumber(model, "model_options", "thermal_tolerance", kDefaults.thermalTolerance);
    }

    validateConfig(config);
    return config;
}

}  // namespace

InductanceFormula parseInductanceFormula(const std::string& value) {
    if (value == "wheeler_log") {
        return InductanceFormula::WheelerLog;
    }
    if (value == "wheeler_modified") {
        return InductanceFormula::WheelerModified;
    }
    throw ConfigError("Unsupported inductance formula: " + value);
}

std::string toString(InductanceFormula formula) {
    switch (formula) {
        case InductanceFormula::WheelerLog:
            return "wheeler_log";
        case InductanceFormula::WheelerModified:
            return "wheeler_modified";
    }
    return "unknown";
}

void validateConfig(const DesignConfig& config) {
    requirePositive("physical_constants.vacuum_permeability", config.physical.vacuumPermeability);
    requirePositive("physical_constants.copper_resistivity", config.physical.copperResistivity);
    requirePositive("physical_constants.oz_to_m", config.physical.ozToM);
    requirePositive("physical_constants.current_density_limit", config.physical.currentDensityLimit);

    requirePositive("thermal_properties.thermal_conductivity_copper", config.thermal.thermalConductivityCopper);
    requirePositive("thermal_properties.thermal_conductivity_fr4", config.thermal.thermalConductivityFr4);
    requirePositive("thermal_properties.fr4_thickness", config.thermal.fr4Thickness);
    requirePositive("thermal_properties.surface_area_multiplier", config.thermal.surfaceAreaMultiplier);
    if (config.thermal.convectionCoefficient) {
        requirePositive("thermal_properties.convection_coefficient", *config.thermal.convectionCoefficient);
    }

    if (config.design.numLayers < 2) {
        throw ConfigError("design_constraints.num_layers must be at least 2");
    }
    requirePositive("design_constraints.copper_weight", config.design.copperWeight);
    requirePositive("design_constraints.max_power", config.design.maxPower);
    requirePositive("design_constraints.voltage", config.design.voltage);
    requirePositive("design_constraints.inner_length", config.design.innerLength);
    requirePositive("design_constraints.inner_width", config.design.innerWidth);
    requirePositive("design_constraints.outer_length", config.design.outerLength);
    requirePositive("design_constraints.outer_width", config.design.outerWidth);
    if (!(config.design.outerLength > config.design.innerLength)) {
        throw ConfigError("design_constraints.outer_length must exceed inner_length");
    }
    if (!(config.design.outerWidth > config.design.innerWidth)) {
        throw ConfigError("design_constraints.outer_width must exceed inner_width");
    }

    requirePositive("manufacturing_constraints.min_trace_width", config.manufacturing.minTraceWidth);
    requirePositive("manufacturing_constraints.max_trace_width", config.manufacturing.maxTraceWidth);
    if (config.manufacturing.maxTraceWidth < config.manufacturing.minTraceWidth) {
        throw ConfigError("manufacturing_constraints.max_trace_width must not be below min_trace_width");
    }
    if (config.manufacturing.minTraceSpacing < 0.0) {
        throw ConfigError("manufacturing_constraints.min_trace_spacing must not be negative");
    }

    if (!(config.model.emissivity > 0.0) || config.model.emissivity > 1.0) {
        throw ConfigError("model_options.emissivity must lie in (0, 1]");
    }
    if (config.model.spaceAmbientTemp <= -CELSIUS_TO_KELVIN) {
        throw ConfigError("model_options.space_ambient_temp must be above absolute zero");
    }
    if (config.design.ambientTemp <= -CELSIUS_TO_KELVIN) {
        throw ConfigError("design_constraints.ambient_temp must be above absolute zero");
    }
    if (config.model.thermalMaxIterations == 0) {
        throw ConfigError("model_options.thermal_max_iterations must be positive");
    }
    requirePositive("model_options.thermal_tolerance", config.model.thermalTolerance);
}

DesignConfig parseConfigJsonText(const std::string& text, const std::string& sourceName) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw ConfigError("Malformed JSON in " + sourceName + ": " + ex.what());
    }
    return parseConfigJson(root);
}

DesignConfig loadConfigFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("Failed to open configuration JSON: " + path);
    }

    std::stringstream buffer;
    buffer << input.rdbuf();
    return parseConfigJsonText(buffer.str(), path);
}

}  // namespace mtqdesign
