// filename: electrical.cpp
// part of PCB Magnetorquer Designer
// MIT License

#include "mtqdesign/electrical.hpp"

#include "mtqdesign/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mtqdesign {
namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// Wheeler, logarithmic form: L = K mu0 N^2 d_avg (ln(4 d_avg / w) - 0.5).
constexpr double kWheelerLogK = 0.4;
// Modified Wheeler (Mohan et al., square planar spiral): L = K1 mu0 N^2 d_avg / (1 + K2 rho).
constexpr double kWheelerModifiedK1 = 2.34;
constexpr double kWheelerModifiedK2 = 2.75;

}  // namespace

std::string toString(CurrentLimit limit) {
    switch (limit) {
        case CurrentLimit::Ohmic:
            return "ohmic";
        case CurrentLimit::Power:
            return "power";
        case CurrentLimit::CurrentDensity:
            return "current_density";
        case CurrentLimit::None:
            return "none";
    }
    return "none";
}

double ElectricalModel::totalLength(double traceWidth) const {
    return geometry_.layerLength(traceWidth) * static_cast<double>(config_.coilLayers());
}

double ElectricalModel::resistance(double traceWidth) const {
    if (!(traceWidth > 0.0) || geometry_.maxTurns(traceWidth) == 0) {
        return kInf;
    }
    const double crossSection = config_.copperThickness() * traceWidth;
    if (!(crossSection > 0.0)) {
        return kInf;
    }

    double resistance = config_.physical.copperResistivity * totalLength(traceWidth) / crossSection;
    if (config_.model.scaleResistanceWithTemperature) {
        const double deltaT = config_.design.operatingTemp - config_.model.referenceTemp;
        resistance *= 1.0 + config_.physical.temperatureCoefficient * deltaT;
    }
    if (!std::isfinite(resistance) || !(resistance > 0.0)) {
        std::ostringstream oss;
        oss << "Resistance evaluated to " << resistance << " ohm at trace width " << traceWidth << " m";
        throw CandidateError(oss.str());
    }
    return resistance;
}

CurrentBounds ElectricalModel::currentBounds(double resistance, double traceWidth) const {
    CurrentBounds bounds{};
    const double voltage = config_.design.voltage;

    bounds.ohmic = (resistance > 0.0 && std::isfinite(resistance)) ? voltage / resistance : 0.0;
    bounds.power = voltage > 0.0 ? config_.design.maxPower / voltage : 0.0;
    bounds.currentDensity =
        traceWidth > 0.0 ? config_.physical.currentDensityLimit * traceWidth * config_.copperThickness() : 0.0;

    bounds.current = bounds.ohmic;
    bounds.limit = CurrentLimit::Ohmic;
    if (bounds.power < bounds.current) {
        bounds.current = bounds.power;
        bounds.limit = CurrentLimit::Power;
    }
    if (bounds.currentDensity < bounds.current) {
        bounds.current = bounds.currentDensity;
        bounds.limit = CurrentLimit::CurrentDensity;
    }
    if (!(bounds.current > 0.0)) {
        bounds.current = 0.0;
        bounds.limit = CurrentLimit::None;
    }
    return bounds;
}

double ElectricalModel::dissipatedPower(double resistance, double current) const {
    if (!std::isfinite(resistance) || !(resistance > 0.0) || !(current > 0.0)) {
        return 0.0;
    }
    return current * current * resistance;
}

double ElectricalModel::currentDensity(double current, double traceWidth) const {
    const double crossSection = traceWidth * config_.copperThickness();
    if (!(crossSection > 0.0)) {
        return current > 0.0 ? kInf : 0.0;
    }
    return current / crossSection;
}

double ElectricalModel::inductance(double traceWidth) const {
    if (!(traceWidth > 0.0)) {
        return 0.0;
    }
    const std::size_t turns = geometry_.maxTurns(traceWidth);
    if (turns == 0) {
        return 0.0;
    }

    const auto& design = config_.design;
    const double outerDiameter = 0.5 * (design.outerLength + design.outerWidth);
    const double innerDiameter = 0.5 * (design.innerLength + design.innerWidth);
    const double avgDiameter = 0.5 * (outerDiameter + innerDiameter);
    // Series layers add turns.
    const double effectiveTurns = static_cast<double>(turns) * static_cast<double>(config_.coilLayers());
    const double mu0 = config_.physical.vacuumPermeability;

    double inductance = 0.0;
    switch (config_.model.inductanceFormula) {
        case InductanceFormula::WheelerLog: {
            const double logArgument = 4.0 * avgDiameter / traceWidth;
            if (!(logArgument > 0.0)) {
                return 0.0;
            }
            inductance = kWheelerLogK * mu0 * effectiveTurns * effectiveTurns * avgDiameter *
                         (std::log(logArgument) - 0.5);
            break;
        }
        case InductanceFormula::WheelerModified: {
            const double denom = outerDiameter + innerDiameter;
            const double fillRatio = denom > 0.0 ? (outerDiameter - innerDiameter) / denom : 0.0;
            inductance = kWheelerModifiedK1 * mu0 * effectiveTurns * effectiveTurns * avgDiameter /
                         (1.0 + kWheelerModifiedK2 * fillRatio);
            break;
        }
    }
    return std::max(0.0, inductance);
}

double ElectricalModel::timeConstant(double traceWidth) const {
    const double r = resistance(traceWidth);
    if (!std::isfinite(r) || !(r > 0.0)) {
        return 0.0;
    }
    return inductance(traceWidth) / r;
}

double ElectricalModel::timeToFraction(double traceWidth, double fraction) const {
    if (!(fraction >= 0.0) || !(fraction < 1.0)) {
        throw std::invalid_argument("timeToFraction: fraction must lie in [0, 1)");
    }
    return -timeConstant(traceWidth) * std::log(1.0 - fraction);
}

double ElectricalModel::magneticMoment(double traceWidth, double current) const {
    if (!(current > 0.0) || geometry_.maxTurns(traceWidth) == 0) {
        return 0.0;
    }
    return geometry_.layerArea(traceWidth) * current * static_cast<double>(config_.coilLayers());
}

}  // namespace mtqdesign
