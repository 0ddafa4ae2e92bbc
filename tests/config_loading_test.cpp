// filename: config_loading_test.cpp
// part of PCB Magnetorquer Designer
// MIT License

#include "mtqdesign/config.hpp"
#include "mtqdesign/errors.hpp"

#include <cmath>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <string>

namespace {

namespace fs = std::filesystem;

std::string fixture(const std::string& name) {
    return (fs::path(__FILE__).parent_path() / "../inputs/tests" / name).lexically_normal().string();
}

// Expects loading @p path to fail with a ConfigError whose message contains @p needle.
bool expectConfigError(const std::string& path, const std::string& needle) {
    try {
        (void)mtqdesign::loadConfigFromJson(path);
    } catch (const mtqdesign::ConfigError& ex) {
        const std::string message = ex.what();
        if (message.find(needle) == std::string::npos) {
            std::cerr << "ConfigError for " << path << " did not mention '" << needle << "': " << message << "\n";
            return false;
        }
        return true;
    }
    std::cerr << "Expected ConfigError loading " << path << "\n";
    return false;
}

}  // namespace

int main() {
    using namespace mtqdesign;

    DesignConfig config;
    try {
        config = loadConfigFromJson(fixture("square_board_fixed_width.json"));
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load square board config: " << ex.what() << "\n";
        return 1;
    }

    if (config.design.numLayers != 6 || config.coilLayers() != 5) {
        std::cerr << "Unexpected layer counts: " << config.design.numLayers << " / " << config.coilLayers() << "\n";
        return 1;
    }
    if (std::abs(config.copperThickness() - 2.0 * 3.48e-5) > 1e-15) {
        std::cerr << "Copper thickness mismatch: " << config.copperThickness() << "\n";
        return 1;
    }
    if (std::abs(config.design.outerLength - 0.1) > 1e-15 ||
        std::abs(config.manufacturing.minTraceWidth - 0.45e-3) > 1e-15) {
        std::cerr << "Dimensions not loaded in metres\n";
        return 1;
    }
    if (config.groundModelEnabled()) {
        std::cerr << "Ground model should be disabled without a convection coefficient\n";
        return 1;
    }
    if (config.model.inductanceFormula != kDefaults.inductanceFormula ||
        config.model.emissivity != kDefaults.emissivity ||
        config.model.thermalMaxIterations != kDefaults.thermalMaxIterations) {
        std::cerr << "Model options did not fall back to the defaults table\n";
        return 1;
    }

    DesignConfig wide;
    try {
        wide = loadConfigFromJson(fixture("square_board_wide_range.json"));
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load wide-range config: " << ex.what() << "\n";
        return 1;
    }
    if (!wide.groundModelEnabled() || std::abs(*wide.thermal.convectionCoefficient - 10.0) > 1e-12) {
        std::cerr << "Convection coefficient not picked up\n";
        return 1;
    }

    if (!expectConfigError(fixture("missing_voltage.json"), "design_constraints.voltage")) {
        return 1;
    }
    if (!expectConfigError(fixture("malformed.json"), "Malformed JSON")) {
        return 1;
    }
    if (!expectConfigError(fixture("does_not_exist.json"), "does_not_exist.json")) {
        return 1;
    }
    if (!expectConfigError(fixture("inner_exceeds_outer.json"), "outer_length")) {
        return 1;
    }

    const std::string singleLayer = R"({
        "physical_constants": {"copper_resistivity": 1.68e-8, "temperature_coefficient": 0.00393,
                               "oz_to_m": 3.48e-5, "current_density_limit": 35e6},
        "thermal_properties": {"thermal_conductivity_copper": 385, "thermal_conductivity_fr4": 0.3,
                               "fr4_thickness": 1.6e-3, "surface_area_multiplier": 2},
        "design_constraints": {"num_layers": 1, "copper_weight": 1, "max_power": 1, "voltage": 5,
                               "inner_length": 0.01, "inner_width": 0.01, "outer_length": 0.05,
                               "outer_width": 0.05, "operating_temp": 85, "ambient_temp": 25},
        "manufacturing_constraints": {"min_trace_width": 1e-4, "max_trace_width": 1e-3,
                                      "min_trace_spacing": 1e-4},
        "model_options": {"inductance_formula": "wheeler_modified"}
    })";
    try {
        (void)parseConfigJsonText(singleLayer);
        std::cerr << "num_layers = 1 should be rejected\n";
        return 1;
    } catch (const ConfigError& ex) {
        if (std::string(ex.what()).find("num_layers") == std::string::npos) {
            std::cerr << "Unexpected message for num_layers: " << ex.what() << "\n";
            return 1;
        }
    }

    // Layer counts that do not fit an int are rejected by name instead of being truncated.
    for (const char* layers : {"1e20", "3000000000", "-3000000000", "2.5"}) {
        std::string text = singleLayer;
        text.replace(text.find("\"num_layers\": 1"), 15, std::string("\"num_layers\": ") + layers);
        try {
            (void)parseConfigJsonText(text);
            std::cerr << "num_layers = " << layers << " should be rejected\n";
            return 1;
        } catch (const ConfigError& ex) {
            if (std::string(ex.what()).find("design_constraints.num_layers") == std::string::npos) {
                std::cerr << "Unexpected message for num_layers = " << layers << ": " << ex.what() << "\n";
                return 1;
            }
        }
    }

    std::string twoLayers = singleLayer;
    twoLayers.replace(twoLayers.find("\"num_layers\": 1"), 15, "\"num_layers\": 2");
    try {
        const DesignConfig parsed = parseConfigJsonText(twoLayers);
        if (parsed.model.inductanceFormula != InductanceFormula::WheelerModified) {
            std::cerr << "inductance_formula override ignored\n";
            return 1;
        }
        if (std::abs(parsed.physical.vacuumPermeability - MU0) > 1e-18) {
            std::cerr << "vacuum_permeability should default to MU0\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Two-layer config rejected: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "Configuration loading verified successfully\n";
    return 0;
}
