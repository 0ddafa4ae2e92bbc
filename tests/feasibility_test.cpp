// filename: feasibility_test.cpp
// part of PCB Magnetorquer Designer
// MIT License

#include "mtqdesign/config.hpp"
#include "mtqdesign/feasibility.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

mtqdesign::DesignConfig makeSquareBoard() {
    mtqdesign::DesignConfig config{};
    config.physical.copperResistivity = 1.68e-8;
    config.physical.temperatureCoefficient = 0.00393;
    config.physical.ozToM = 3.48e-5;
    config.physical.currentDensityLimit = 35e6;
    config.thermal.thermalConductivityCopper = 385.0;
    config.thermal.thermalConductivityFr4 = 0.3;
    config.thermal.fr4Thickness = 1.6e-3;
    config.design.numLayers = 6;
    config.design.copperWeight = 2.0;
    config.design.maxPower = 4.0;
    config.design.voltage = 8.2;
    config.design.innerLength = 0.020;
    config.design.innerWidth = 0.020;
    config.design.outerLength = 0.100;
    config.design.outerWidth = 0.100;
    config.design.operatingTemp = 85.0;
    config.design.ambientTemp = 25.0;
    config.manufacturing.minTraceWidth = 0.1e-3;
    config.manufacturing.maxTraceWidth = 2.0e-3;
    config.manufacturing.minTraceSpacing = 0.1e-3;
    return config;
}

bool mentions(const std::vector<std::string>& failures, const std::string& needle) {
    for (const auto& reason : failures) {
        if (reason.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

int main() {
    using namespace mtqdesign;

    const DesignConfig config = makeSquareBoard();
    const CandidateEvaluator evaluator(config);

    const Candidate good = evaluator.evaluate(0.45e-3);
    if (!good.feasible() || !good.verdict.failures().empty()) {
        std::cerr << "0.45 mm should be feasible on the square board\n";
        for (const auto& reason : good.verdict.failures()) {
            std::cerr << "  " << reason << "\n";
        }
        return 1;
    }
    if (good.turns != 71 || good.turnLengths.size() != 71 || good.turnAreas.size() != 71) {
        std::cerr << "Per-turn data should cover all 71 turns\n";
        return 1;
    }
    const double expectedMoment = evaluator.electrical().magneticMoment(0.45e-3, good.current.current);
    if (!(good.magneticMoment > 0.0) || std::abs(good.objective() - expectedMoment) > 1e-15) {
        std::cerr << "Feasible objective should equal the magnetic moment\n";
        return 1;
    }
    if (good.temperatures.size() != 1 || !(good.temperatures.front().temperatureRise > 15.0) ||
        !(good.temperatures.front().temperatureRise < 16.5)) {
        std::cerr << "Expected a space rise near 15.8 K, got "
                  << (good.temperatures.empty() ? 0.0 : good.temperatures.front().temperatureRise) << "\n";
        return 1;
    }

    const Candidate tooNarrow = evaluator.evaluate(0.05e-3);
    if (tooNarrow.feasible() || tooNarrow.verdict.withinManufacturingBounds || tooNarrow.objective() != 0.0 ||
        tooNarrow.magneticMoment != 0.0) {
        std::cerr << "A width below the manufacturing minimum must be infeasible with zero objective\n";
        return 1;
    }
    if (!mentions(tooNarrow.verdict.failures(), "manufacturing")) {
        std::cerr << "Failure list should name the manufacturing limit\n";
        return 1;
    }

    DesignConfig blocked = config;
    blocked.design.innerLength = blocked.design.outerLength;
    const CandidateEvaluator blockedEvaluator(blocked);
    const Candidate empty = blockedEvaluator.evaluate(0.45e-3);
    if (empty.feasible() || empty.verdict.hasTurns || empty.power != 0.0 || !std::isinf(empty.resistance)) {
        std::cerr << "A board with no room for turns must be infeasible\n";
        return 1;
    }
    // Every check runs even after the first failure.
    if (!empty.verdict.withinManufacturingBounds || !empty.verdict.thermalOk) {
        std::cerr << "Independent checks should still pass for the empty coil\n";
        return 1;
    }

    DesignConfig hot = config;
    hot.design.operatingTemp = 10.0;
    const CandidateEvaluator hotEvaluator(hot);
    const Candidate overheated = hotEvaluator.evaluate(0.45e-3);
    if (overheated.feasible() || overheated.verdict.thermalOk || !overheated.verdict.powerOk ||
        overheated.objective() != 0.0) {
        std::cerr << "A 15.8 K rise from a 25 C ambient must fail a 10 C limit\n";
        return 1;
    }
    if (!mentions(overheated.verdict.failures(), "temperature")) {
        std::cerr << "Failure list should name the temperature limit\n";
        return 1;
    }

    // Operating limit below the ground ambient: no positive rise fits, even with a cold space ambient.
    DesignConfig belowAmbient = config;
    belowAmbient.design.operatingTemp = 20.0;
    belowAmbient.design.ambientTemp = 25.0;
    const CandidateEvaluator belowAmbientEvaluator(belowAmbient);
    const Candidate noHeadroom = belowAmbientEvaluator.evaluate(0.45e-3);
    if (noHeadroom.feasible() || noHeadroom.verdict.thermalOk || noHeadroom.objective() != 0.0) {
        std::cerr << "A 20 C limit under a 25 C ambient must reject a 15.8 K rise\n";
        return 1;
    }
    if (noHeadroom.temperatures.empty() || noHeadroom.temperatures.front().ambient != 0.0) {
        std::cerr << "The reported space ambient should stay at the space value\n";
        return 1;
    }

    // 25 C + 15.8 K sits inside a 45 C limit but outside a 40 C one.
    DesignConfig tight = config;
    tight.design.operatingTemp = 45.0;
    if (!CandidateEvaluator(tight).evaluate(0.45e-3).feasible()) {
        std::cerr << "A 40.8 C board should pass a 45 C limit\n";
        return 1;
    }
    tight.design.operatingTemp = 40.0;
    if (CandidateEvaluator(tight).evaluate(0.45e-3).feasible()) {
        std::cerr << "A 40.8 C board should fail a 40 C limit\n";
        return 1;
    }

    // Current pinned to the density limit sits exactly on the boundary and still passes.
    DesignConfig lowDensity = config;
    lowDensity.physical.currentDensityLimit = 1e6;
    const CandidateEvaluator densityEvaluator(lowDensity);
    const Candidate pinned = densityEvaluator.evaluate(0.45e-3);
    if (pinned.current.limit != CurrentLimit::CurrentDensity || !pinned.verdict.currentDensityOk ||
        !pinned.feasible()) {
        std::cerr << "Density-limited candidate should pass the density check\n";
        return 1;
    }

    // A broken material constant fails the one candidate instead of the whole run.
    DesignConfig broken = config;
    broken.physical.copperResistivity = std::nan("");
    const CandidateEvaluator brokenEvaluator(broken);
    const Candidate failed = brokenEvaluator.evaluate(0.45e-3);
    if (failed.feasible() || failed.verdict.modelError.empty() || failed.objective() != 0.0 ||
        !mentions(failed.verdict.failures(), "model error")) {
        std::cerr << "A model error should mark the candidate infeasible\n";
        return 1;
    }

    Candidate forged = good;
    forged.power = 4.5;
    forged.currentDensity = 40e6;
    const FeasibilityVerdict forgedVerdict = evaluator.checkConstraints(forged);
    if (forgedVerdict.powerOk || forgedVerdict.currentDensityOk || forgedVerdict.feasible()) {
        std::cerr << "Power and density above their limits must both be flagged\n";
        return 1;
    }
    if (!mentions(forgedVerdict.failures(), "power") || !mentions(forgedVerdict.failures(), "density")) {
        std::cerr << "Failure list should name power and density\n";
        return 1;
    }

    std::cout << "Feasibility checks verified successfully\n";
    return 0;
}
