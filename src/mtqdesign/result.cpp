#include "mtqdesign/result.hpp"

#include "mtqdesign/electrical.hpp"
#include "mtqdesign/feasibility.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace mtqdesign {
namespace {

constexpr double kMmPerM = 1e3;
constexpr double kMsPerS = 1e3;
constexpr double kMicroHenryPerHenry = 1e6;
constexpr double kSquareMmPerSquareM = 1e6;
constexpr double kSettleFraction = 0.99;

}  // namespace

double roundTo(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    const double scale = std::pow(10.0, decimals);
    const double rounded = std::round(value * scale) / scale;
    // Normalise -0.0 so records compare equal textually.
    return rounded == 0.0 ? 0.0 : rounded;
}

DesignResult analyzeResult(const DesignConfig& config, const OptimizationResult& optimization) {
    DesignResult result{};
    result.config = config;
    result.samplesEvaluated = optimization.samplesEvaluated;
    result.feasibleSamples = optimization.feasibleSamples;
    result.refined = optimization.refined;

    const CandidateEvaluator evaluator(config);
    if (!optimization.found) {
        result.found = false;
        result.candidate.temperatures = evaluator.thermal().evaluate(0.0);
        return result;
    }

    result.found = true;
    result.candidate = evaluator.evaluate(optimization.traceWidth);
    const ElectricalModel& electrical = evaluator.electrical();
    result.timeConstant = electrical.timeConstant(optimization.traceWidth);
    result.timeTo99Percent = electrical.timeToFraction(optimization.traceWidth, kSettleFraction);
    result.moment99Percent = kSettleFraction * result.candidate.magneticMoment;
    return result;
}

DesignRecord makeDesignRecord(const DesignResult& result) {
    const DesignConfig& config = result.config;
    const Candidate& candidate = result.candidate;

    DesignRecord record{};
    record.status = result.found ? "ok" : "no_feasible_design";

    record.inner.length = roundTo(config.design.innerLength * kMmPerM, 1);
    record.inner.width = roundTo(config.design.innerWidth * kMmPerM, 1);
    record.outer.length = roundTo(config.design.outerLength * kMmPerM, 1);
    record.outer.width = roundTo(config.design.outerWidth * kMmPerM, 1);

    record.traces.width = roundTo(candidate.traceWidth * kMmPerM, 3);
    record.traces.spacing = roundTo(config.manufacturing.minTraceSpacing * kMmPerM, 3);
    record.traces.turnsPerLayer = static_cast<long long>(candidate.turns);
    record.traces.totalLayers = config.design.numLayers;
    record.traces.totalLength = roundTo(candidate.totalLength, 2);

    const double resistance = std::isfinite(candidate.resistance) ? candidate.resistance : 0.0;
    record.electrical.resistance = roundTo(resistance, 2);
    record.electrical.voltage = roundTo(config.design.voltage, 2);
    record.electrical.current = roundTo(candidate.current.current, 3);
    record.electrical.power = roundTo(candidate.power, 2);
    record.electrical.currentDensity = roundTo(candidate.currentDensity / kSquareMmPerSquareM, 2);
    record.electrical.inductance = roundTo(candidate.inductance * kMicroHenryPerHenry, 3);

    for (const auto& entry : candidate.temperatures) {
        DesignRecord::Environment environment{};
        environment.name = toString(entry.environment);
        environment.ambient = roundTo(entry.ambient, 2);
        environment.temperatureRise = roundTo(entry.temperatureRise, 2);
        environment.finalTemperature = roundTo(entry.finalTemperature, 2);
        record.thermal.push_back(environment);
    }

    record.magneticMoment = roundTo(candidate.magneticMoment, 4);

    record.dynamics.inductance = record.electrical.inductance;
    record.dynamics.timeConstant = roundTo(result.timeConstant * kMsPerS, 3);
    record.dynamics.timeTo99Percent = roundTo(result.timeTo99Percent * kMsPerS, 3);
    record.dynamics.maxMoment99Percent = roundTo(result.moment99Percent, 4);

    record.optimization.samples = static_cast<long long>(result.samplesEvaluated);
    record.optimization.feasibleSamples = static_cast<long long>(result.feasibleSamples);
    record.optimization.limitingCurrent = toString(candidate.current.limit);
    record.optimization.refined = result.refined;
    return record;
}

}  // namespace mtqdesign
