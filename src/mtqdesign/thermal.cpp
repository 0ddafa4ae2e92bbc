// filename: thermal.cpp
// part of PCB Magnetorquer Designer
// MIT License

#include "mtqdesign/thermal.hpp"

#include "mtqdesign/errors.hpp"
#include "mtqdesign/types.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mtqdesign {
namespace {

constexpr double kSeedOffsetK = 5.0;

}  // namespace

std::string toString(ThermalEnvironment environment) {
    switch (environment) {
        case ThermalEnvironment::Space:
            return "space";
        case ThermalEnvironment::GroundTest:
            return "ground_test";
    }
    return "unknown";
}

RadiativeSolveResult solveRadiativeBalance(double power, double emissivity, double area, double ambientK,
                                           const ThermalSolveOptions& options) {
    RadiativeSolveResult result{};
    result.temperatureK = ambientK;
    if (power == 0.0) {
        result.converged = true;
        return result;
    }

    const double coeff = emissivity * STEFAN_BOLTZMANN * area;
    if (!(coeff > 0.0) || !(ambientK > 0.0) || !std::isfinite(power)) {
        return result;
    }
    const double ambient4 = ambientK * ambientK * ambientK * ambientK;

    double T = ambientK + kSeedOffsetK;
    for (std::size_t iter = 1; iter <= options.maxIters; ++iter) {
        const double T2 = T * T;
        const double residual = coeff * (T2 * T2 - ambient4) - power;
        const double slope = 4.0 * coeff * T2 * T;
        if (!(slope > 0.0)) {
            result.temperatureK = T;
            result.iters = iter;
            return result;
        }
        const double step = residual / slope;
        T -= step;
        result.temperatureK = T;
        result.iters = iter;
        if (!std::isfinite(T) || !(T > 0.0)) {
            return result;
        }
        if (std::abs(step) <= options.tol) {
            result.converged = true;
            return result;
        }
    }
    return result;
}

ThermalModel::ThermalModel(const DesignConfig& config) : config_(config) {
    options_.maxIters = config.model.thermalMaxIterations;
    options_.tol = config.model.thermalTolerance;
}

double ThermalModel::surfaceArea() const {
    return config_.thermal.surfaceAreaMultiplier * config_.design.outerLength * config_.design.outerWidth;
}

double ThermalModel::spaceTemperatureRise(double power) const {
    if (power < 0.0) {
        throw std::invalid_argument("spaceTemperatureRise: power must not be negative");
    }
    if (power == 0.0) {
        return 0.0;
    }

    const double ambientK = config_.model.spaceAmbientTemp + CELSIUS_TO_KELVIN;
    const RadiativeSolveResult solve =
        solveRadiativeBalance(power, config_.model.emissivity, surfaceArea(), ambientK, options_);
    if (!solve.converged) {
        std::ostringstream oss;
        oss << "Radiative heat balance did not converge for P=" << power << " W after " << solve.iters
            << " iterations (last T=" << solve.temperatureK << " K)";
        throw ThermalSolverError(oss.str());
    }
    return solve.temperatureK - ambientK;
}

double ThermalModel::groundTemperatureRise(double power) const {
    if (!config_.thermal.convectionCoefficient) {
        throw std::logic_error("groundTemperatureRise: convection coefficient not configured");
    }
    if (power <= 0.0) {
        return 0.0;
    }
    const double area = surfaceArea();
    const double conduction = config_.thermal.fr4Thickness / (config_.thermal.thermalConductivityFr4 * area);
    const double convection = 1.0 / (*config_.thermal.convectionCoefficient * area);
    const double total = (conduction * convection) / (conduction + convection);
    return power * total;
}

std::vector<EnvironmentTemperature> ThermalModel::evaluate(double power) const {
    std::vector<EnvironmentTemperature> temperatures;

    EnvironmentTemperature space{};
    space.environment = ThermalEnvironment::Space;
    space.ambient = config_.model.spaceAmbientTemp;
    space.temperatureRise = spaceTemperatureRise(power);
    space.finalTemperature = space.ambient + space.temperatureRise;
    temperatures.push_back(space);

    if (config_.groundModelEnabled()) {
        EnvironmentTemperature ground{};
        ground.environment = ThermalEnvironment::GroundTest;
        ground.ambient = config_.design.ambientTemp;
        ground.temperatureRise = groundTemperatureRise(power);
        ground.finalTemperature = ground.ambient + ground.temperatureRise;
        temperatures.push_back(ground);
    }
    return temperatures;
}

bool ThermalModel::isThermalSafe(const std::vector<EnvironmentTemperature>& temperatures) const {
    for (const auto& entry : temperatures) {
        // Space rise is judged from the ground ambient whenever that is warmer.
        double ambient = entry.ambient;
        if (entry.environment == ThermalEnvironment::Space) {
            ambient = std::max(ambient, config_.design.ambientTemp);
        }
        if (ambient + entry.temperatureRise > config_.design.operatingTemp) {
            return false;
        }
    }
    return true;
}

}  // namespace mtqdesign
