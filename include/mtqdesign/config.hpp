#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "mtqdesign/types.hpp"

namespace mtqdesign {

enum class InductanceFormula { WheelerLog, WheelerModified };

/**
 * @brief Fallback values for every optional configuration field.
 *
 * Loaded once by loadConfigFromJson; a field present in the JSON always wins.
 */
struct ConfigDefaults {
    double vacuumPermeability{MU0};
    double emissivity{0.9};
    double spaceAmbientTemp{0.0};  // degC
    double referenceTemp{20.0};    // degC
    bool scaleResistanceWithTemperature{false};
    InductanceFormula inductanceFormula{InductanceFormula::WheelerLog};
    std::size_t thermalMaxIterations{100};
    double thermalTolerance{1e-9};  // K
};

inline constexpr ConfigDefaults kDefaults{};

struct DesignConfig {
    struct PhysicalConstants {
        double vacuumPermeability{MU0};
        double copperResistivity{0.0};       // ohm m
        double temperatureCoefficient{0.0};  // 1/K
        double ozToM{0.0};                   // copper thickness per oz/ft^2
        double currentDensityLimit{0.0};     // A/m^2
    };

    struct ThermalProperties {
        double thermalConductivityCopper{0.0};  // W/(m K)
        double thermalConductivityFr4{0.0};     // W/(m K)
        double fr4Thickness{0.0};               // m
        double surfaceAreaMultiplier{2.0};
        std::optional<double> convectionCoefficient;  // W/(m^2 K), enables the ground-test model
    };

    struct DesignConstraints {
        int numLayers{0};
        double copperWeight{0.0};  // oz
        double maxPower{0.0};      // W
        double voltage{0.0};       // V
        double innerLength{0.0};   // m
        double innerWidth{0.0};    // m
        double outerLength{0.0};   // m
        double outerWidth{0.0};    // m
        double operatingTemp{0.0};  // degC, upper limit
        double ambientTemp{0.0};    // degC, ground-test ambient
    };

    struct ManufacturingConstraints {
        double minTraceWidth{0.0};    // m
        double maxTraceWidth{0.0};    // m
        double minTraceSpacing{0.0};  // m
    };

    struct ModelOptions {
        InductanceFormula inductanceFormula{kDefaults.inductanceFormula};
        double emissivity{kDefaults.emissivity};
        double spaceAmbientTemp{kDefaults.spaceAmbientTemp};
        double referenceTemp{kDefaults.referenceTemp};
        bool scaleResistanceWithTemperature{kDefaults.scaleResistanceWithTemperature};
        std::size_t thermalMaxIterations{kDefaults.thermalMaxIterations};
        double thermalTolerance{kDefaults.thermalTolerance};
    };

    PhysicalConstants physical;
    ThermalProperties thermal;
    DesignConstraints design;
    ManufacturingConstraints manufacturing;
    ModelOptions model;

    [[nodiscard]] double copperThickness() const { return design.copperWeight * physical.ozToM; }
    // One layer carries the interconnect to the driver; the rest form the coil.
    [[nodiscard]] int coilLayers() const { return design.numLayers - 1; }
    [[nodiscard]] bool groundModelEnabled() const { return thermal.convectionCoefficient.has_value(); }
};

DesignConfig loadConfigFromJson(const std::string& path);

DesignConfig parseConfigJsonText(const std::string& text, const std::string& sourceName = "<string>");

// Throws ConfigError naming the first offending field.
void validateConfig(const DesignConfig& config);

InductanceFormula parseInductanceFormula(const std::string& value);
std::string toString(InductanceFormula formula);

}  // namespace mtqdesign
