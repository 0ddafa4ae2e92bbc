// filename: electrical.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

#include <string>

#include "mtqdesign/config.hpp"
#include "mtqdesign/geometry.hpp"

namespace mtqdesign {

enum class CurrentLimit { Ohmic, Power, CurrentDensity, None };

std::string toString(CurrentLimit limit);

/**
 * @brief The three independent current bounds and the one that won.
 */
struct CurrentBounds {
    double ohmic{0.0};           // V / R
    double power{0.0};           // Pmax / V
    double currentDensity{0.0};  // Jmax * w * t_cu
    double current{0.0};
    CurrentLimit limit{CurrentLimit::None};
};

/**
 * @brief Resistance, drive current, inductance and dipole moment of the coil stack.
 *
 * All coil layers are wired in series, so trace length and effective turn count scale
 * with the number of coil layers. Inputs and outputs are SI.
 */
class ElectricalModel {
public:
    explicit ElectricalModel(const DesignConfig& config) : config_(config), geometry_(config) {}

    [[nodiscard]] const CoilGeometry& geometry() const { return geometry_; }

    /// Trace length over all coil layers.
    [[nodiscard]] double totalLength(double traceWidth) const;

    /// +infinity when no coil fits or the width is not positive.
    [[nodiscard]] double resistance(double traceWidth) const;

    [[nodiscard]] CurrentBounds currentBounds(double resistance, double traceWidth) const;
    [[nodiscard]] double current(double resistance, double traceWidth) const {
        return currentBounds(resistance, traceWidth).current;
    }

    /// I^2 R, 0 when the resistance is infinite.
    [[nodiscard]] double dissipatedPower(double resistance, double current) const;

    /// Current per copper cross-section, A/m^2.
    [[nodiscard]] double currentDensity(double current, double traceWidth) const;

    [[nodiscard]] double inductance(double traceWidth) const;
    [[nodiscard]] double timeConstant(double traceWidth) const;
    /// Time for the RL step response to reach @p fraction of its final current.
    [[nodiscard]] double timeToFraction(double traceWidth, double fraction) const;

    [[nodiscard]] double magneticMoment(double traceWidth, double current) const;

private:
    DesignConfig config_;
    CoilGeometry geometry_;
};

}  // namespace mtqdesign
