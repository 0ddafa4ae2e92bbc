// filename: feasibility.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mtqdesign/config.hpp"
#include "mtqdesign/electrical.hpp"
#include "mtqdesign/geometry.hpp"
#include "mtqdesign/thermal.hpp"

namespace mtqdesign {

/**
 * @brief Outcome of the five independent constraint checks for one trace width.
 *
 * Every check is evaluated even when an earlier one already failed.
 */
struct FeasibilityVerdict {
    bool withinManufacturingBounds{false};
    bool hasTurns{false};
    bool currentDensityOk{false};
    bool thermalOk{false};
    bool powerOk{false};
    // Set when a model error other than a thermal solver failure hit this candidate.
    std::string modelError;

    [[nodiscard]] bool feasible() const {
        return withinManufacturingBounds && hasTurns && currentDensityOk && thermalOk && powerOk &&
               modelError.empty();
    }

    [[nodiscard]] std::vector<std::string> failures() const;
};

/**
 * @brief Everything derived from one trace width, SI units throughout.
 */
struct Candidate {
    double traceWidth{0.0};
    std::size_t turns{0};
    std::vector<double> turnLengths;
    std::vector<double> turnAreas;
    double totalLength{0.0};
    double resistance{0.0};
    CurrentBounds current;
    double power{0.0};
    double currentDensity{0.0};
    double inductance{0.0};
    std::vector<EnvironmentTemperature> temperatures;
    FeasibilityVerdict verdict;
    double magneticMoment{0.0};  // only computed for feasible candidates

    [[nodiscard]] bool feasible() const { return verdict.feasible(); }
    /// The flattened search objective: the moment when feasible, exactly 0 otherwise.
    [[nodiscard]] double objective() const { return feasible() ? magneticMoment : 0.0; }
};

class CandidateEvaluator {
public:
    explicit CandidateEvaluator(const DesignConfig& config);

    [[nodiscard]] const DesignConfig& config() const { return config_; }
    [[nodiscard]] const CoilGeometry& geometry() const { return geometry_; }
    [[nodiscard]] const ElectricalModel& electrical() const { return electrical_; }
    [[nodiscard]] const ThermalModel& thermal() const { return thermal_; }

    /**
     * @brief Run geometry, electrical and thermal models, then the constraint checks.
     *
     * ThermalSolverError propagates; any other CandidateError is recorded in the verdict.
     */
    [[nodiscard]] Candidate evaluate(double traceWidth) const;

    [[nodiscard]] FeasibilityVerdict checkConstraints(const Candidate& candidate) const;

private:
    DesignConfig config_;
    CoilGeometry geometry_;
    ElectricalModel electrical_;
    ThermalModel thermal_;
};

}  // namespace mtqdesign
