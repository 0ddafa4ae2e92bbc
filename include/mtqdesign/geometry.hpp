// filename: geometry.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

#include <cstddef>
#include <vector>

#include "mtqdesign/config.hpp"

namespace mtqdesign {

/**
 * @brief Nested rectangular spiral turns between the outer board rectangle and the
 *        inner keepout.
 *
 * Turn 0 follows the outer rectangle; each following turn is offset inward by one pitch
 * (trace width + minimum spacing) on every side. All lengths are in metres.
 */
class CoilGeometry {
public:
    explicit CoilGeometry(const DesignConfig& config) : config_(config) {}

    [[nodiscard]] double pitch(double traceWidth) const {
        return traceWidth + config_.manufacturing.minTraceSpacing;
    }

    /**
     * @brief Clearance kept around the inner keepout for the connection leaving the
     *        innermost turn: one trace plus a gap on either side.
     */
    [[nodiscard]] double innerClearance(double traceWidth) const {
        return traceWidth + 2.0 * config_.manufacturing.minTraceSpacing;
    }

    /// Turns that fit per layer; 0 when no coil fits.
    [[nodiscard]] std::size_t maxTurns(double traceWidth) const;

    /// Perimeter of turn @p turnIndex plus the connector joining it to its neighbour.
    [[nodiscard]] double turnLength(std::size_t turnIndex, double traceWidth) const;

    /// Area enclosed by turn @p turnIndex; 0 once the turn would cross the keepout.
    [[nodiscard]] double turnArea(std::size_t turnIndex, double traceWidth) const;

    [[nodiscard]] std::vector<double> turnLengths(double traceWidth) const;
    [[nodiscard]] std::vector<double> turnAreas(double traceWidth) const;

    /// Trace length of one coil layer.
    [[nodiscard]] double layerLength(double traceWidth) const;
    /// Enclosed area summed over the turns of one coil layer.
    [[nodiscard]] double layerArea(double traceWidth) const;

    struct PathPoint {
        double x{0.0};
        double y{0.0};
        std::size_t turn{0};
    };

    /**
     * @brief Centre-line vertices of one coil layer, board centre at the origin.
     *
     * Each turn starts at its lower-left corner, runs counter-clockwise around its rectangle
     * and steps one pitch inward to the start of the next turn. Returns an empty path when
     * no turn fits.
     */
    [[nodiscard]] std::vector<PathPoint> spiralPath(double traceWidth) const;

private:
    DesignConfig config_;
};

}  // namespace mtqdesign
