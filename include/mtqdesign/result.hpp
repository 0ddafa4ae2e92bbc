// filename: result.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mtqdesign/config.hpp"
#include "mtqdesign/feasibility.hpp"
#include "mtqdesign/optimizer.hpp"

namespace mtqdesign {

/**
 * @brief Final design in SI units, before any rounding.
 */
struct DesignResult {
    bool found{false};
    DesignConfig config;
    Candidate candidate;
    double timeConstant{0.0};     // s
    double timeTo99Percent{0.0};  // s
    double moment99Percent{0.0};  // A m^2
    std::size_t samplesEvaluated{0};
    std::size_t feasibleSamples{0};
    bool refined{false};
};

/**
 * @brief Re-evaluate the winning width from scratch and collect the final metrics.
 *
 * When the optimization found nothing, returns the degenerate result: config echo with all
 * derived metrics zero.
 */
DesignResult analyzeResult(const DesignConfig& config, const OptimizationResult& optimization);

/**
 * @brief Design record in display units, rounded per field. This is what gets serialized.
 */
struct DesignRecord {
    struct Rect {
        double length{0.0};  // mm
        double width{0.0};   // mm
    };

    struct Traces {
        double width{0.0};    // mm
        double spacing{0.0};  // mm
        long long turnsPerLayer{0};
        long long totalLayers{0};
        double totalLength{0.0};  // m
    };

    struct Electrical {
        double resistance{0.0};      // ohm
        double voltage{0.0};         // V
        double current{0.0};         // A
        double power{0.0};           // W
        double currentDensity{0.0};  // A/mm^2
        double inductance{0.0};      // uH
    };

    struct Environment {
        std::string name;
        double ambient{0.0};           // degC
        double temperatureRise{0.0};   // degC
        double finalTemperature{0.0};  // degC
    };

    struct Dynamics {
        double inductance{0.0};          // uH
        double timeConstant{0.0};        // ms
        double timeTo99Percent{0.0};     // ms
        double maxMoment99Percent{0.0};  // A m^2
    };

    struct Optimization {
        long long samples{0};
        long long feasibleSamples{0};
        std::string limitingCurrent;
        bool refined{false};
    };

    std::string status;
    Rect inner;
    Rect outer;
    Traces traces;
    Electrical electrical;
    std::vector<Environment> thermal;
    double magneticMoment{0.0};  // A m^2
    Dynamics dynamics;
    Optimization optimization;
};

DesignRecord makeDesignRecord(const DesignResult& result);

double roundTo(double value, int decimals);

}  // namespace mtqdesign
