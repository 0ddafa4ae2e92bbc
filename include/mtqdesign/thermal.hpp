// filename: thermal.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mtqdesign/config.hpp"

namespace mtqdesign {

enum class ThermalEnvironment { Space, GroundTest };

std::string toString(ThermalEnvironment environment);

struct ThermalSolveOptions {
    std::size_t maxIters{100};
    double tol{1e-9};  // K, on the Newton step
};

struct RadiativeSolveResult {
    double temperatureK{0.0};
    std::size_t iters{0};
    bool converged{false};
};

/**
 * @brief Solve P = eps * sigma * A * (T^4 - Tamb^4) for T by Newton iteration.
 *
 * Seeded at Tamb + 5 K. Never throws; the caller decides what a failed solve means.
 */
RadiativeSolveResult solveRadiativeBalance(double power, double emissivity, double area, double ambientK,
                                           const ThermalSolveOptions& options);

struct EnvironmentTemperature {
    ThermalEnvironment environment{ThermalEnvironment::Space};
    double ambient{0.0};           // degC
    double temperatureRise{0.0};   // K
    double finalTemperature{0.0};  // degC
};

class ThermalModel {
public:
    explicit ThermalModel(const DesignConfig& config);

    /// Total radiating / convecting surface, both faces of the board.
    [[nodiscard]] double surfaceArea() const;

    /// Radiative-only rise in vacuum. Throws ThermalSolverError if the solve fails.
    [[nodiscard]] double spaceTemperatureRise(double power) const;

    /// Substrate conduction in parallel with convection to air.
    [[nodiscard]] double groundTemperatureRise(double power) const;

    /// One entry per enabled environment, space first.
    [[nodiscard]] std::vector<EnvironmentTemperature> evaluate(double power) const;

    /// ambient + rise must stay at or below the operating limit in every environment. The space
    /// rise is judged from the warmer of the space ambient and design_constraints.ambient_temp.
    [[nodiscard]] bool isThermalSafe(const std::vector<EnvironmentTemperature>& temperatures) const;
    [[nodiscard]] bool isThermalSafe(double power) const { return isThermalSafe(evaluate(power)); }

private:
    DesignConfig config_;
    ThermalSolveOptions options_;
};

}  // namespace mtqdesign
