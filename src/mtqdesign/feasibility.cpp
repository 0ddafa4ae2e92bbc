#include "mtqdesign/feasibility.hpp"

#include "mtqdesign/errors.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace mtqdesign {
namespace {

// The current is clamped to exactly Jmax * w * t_cu; dividing back must not trip the check.
constexpr double kRelativeSlack = 1e-9;

}  // namespace

std::vector<std::string> FeasibilityVerdict::failures() const {
    std::vector<std::string> reasons;
    if (!withinManufacturingBounds) {
        reasons.emplace_back("trace width outside manufacturing limits");
    }
    if (!hasTurns) {
        reasons.emplace_back("no turn fits between outer and inner rectangles");
    }
    if (!currentDensityOk) {
        reasons.emplace_back("current density above limit");
    }
    if (!thermalOk) {
        reasons.emplace_back("temperature above operating limit");
    }
    if (!powerOk) {
        reasons.emplace_back("dissipated power above limit");
    }
    if (!modelError.empty()) {
        reasons.push_back("model error: " + modelError);
    }
    return reasons;
}

CandidateEvaluator::CandidateEvaluator(const DesignConfig& config)
    : config_(config), geometry_(config), electrical_(config), thermal_(config) {}

Candidate CandidateEvaluator::evaluate(double traceWidth) const {
    Candidate candidate{};
    candidate.traceWidth = traceWidth;

    try {
        candidate.turns = geometry_.maxTurns(traceWidth);
        candidate.turnLengths = geometry_.turnLengths(traceWidth);
        candidate.turnAreas = geometry_.turnAreas(traceWidth);
        candidate.totalLength = electrical_.totalLength(traceWidth);
        candidate.resistance = electrical_.resistance(traceWidth);
        candidate.current = electrical_.currentBounds(candidate.resistance, traceWidth);
        candidate.power = electrical_.dissipatedPower(candidate.resistance, candidate.current.current);
        candidate.currentDensity = electrical_.currentDensity(candidate.current.current, traceWidth);
        candidate.inductance = electrical_.inductance(traceWidth);
        candidate.temperatures = thermal_.evaluate(candidate.power);
    } catch (const CandidateError& ex) {
        candidate.verdict = checkConstraints(candidate);
        candidate.verdict.modelError = ex.what();
        return candidate;
    }

    candidate.verdict = checkConstraints(candidate);
    if (candidate.verdict.feasible()) {
        candidate.magneticMoment = electrical_.magneticMoment(traceWidth, candidate.current.current);
    }
    return candidate;
}

FeasibilityVerdict CandidateEvaluator::checkConstraints(const Candidate& candidate) const {
    FeasibilityVerdict verdict{};
    const double width = candidate.traceWidth;
    verdict.withinManufacturingBounds =
        width >= config_.manufacturing.minTraceWidth && width <= config_.manufacturing.maxTraceWidth;
    verdict.hasTurns = candidate.turns >= 1;
    const double densityLimit = config_.physical.currentDensityLimit * (1.0 + kRelativeSlack);
    verdict.currentDensityOk = std::isfinite(candidate.currentDensity) && candidate.currentDensity <= densityLimit;
    verdict.thermalOk = !candidate.temperatures.empty() && thermal_.isThermalSafe(candidate.temperatures);
    verdict.powerOk = candidate.power <= config_.design.maxPower * (1.0 + kRelativeSlack);
    return verdict;
}

}  // namespace mtqdesign
