// filename: geometry.cpp
// part of PCB Magnetorquer Designer
// MIT License

#include "mtqdesign/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace mtqdesign {

std::size_t CoilGeometry::maxTurns(double traceWidth) const {
    if (!(traceWidth > 0.0)) {
        return 0;
    }

    const auto& design = config_.design;
    if (design.innerLength >= design.outerLength || design.innerWidth >= design.outerWidth) {
        return 0;
    }

    const double clearance = innerClearance(traceWidth);
    const double effectiveInnerLength = design.innerLength + 2.0 * clearance;
    const double effectiveInnerWidth = design.innerWidth + 2.0 * clearance;

    const double marginLength = 0.5 * (design.outerLength - effectiveInnerLength);
    const double marginWidth = 0.5 * (design.outerWidth - effectiveInnerWidth);
    if (marginLength <= 0.0 || marginWidth <= 0.0) {
        return 0;
    }

    const double turnPitch = pitch(traceWidth);
    const double turnsLength = std::floor(marginLength / turnPitch);
    const double turnsWidth = std::floor(marginWidth / turnPitch);
    const double turns = std::min(turnsLength, turnsWidth);
    return std::max<std::size_t>(1, static_cast<std::size_t>(turns));
}

double CoilGeometry::turnLength(std::size_t turnIndex, double traceWidth) const {
    if (!(traceWidth > 0.0)) {
        return 0.0;
    }
    const double turnPitch = pitch(traceWidth);
    const double offset = static_cast<double>(turnIndex) * turnPitch;
    const double length = std::max(0.0, config_.design.outerLength - 2.0 * offset);
    const double width = std::max(0.0, config_.design.outerWidth - 2.0 * offset);

    // Connector to the next turn, or to the via / board edge for the end turns.
    const double connector = turnPitch;
    return 2.0 * (length + width) + connector;
}

double CoilGeometry::turnArea(std::size_t turnIndex, double traceWidth) const {
    if (!(traceWidth > 0.0)) {
        return 0.0;
    }
    const double offset = static_cast<double>(turnIndex) * pitch(traceWidth);
    const double length = config_.design.outerLength - 2.0 * offset;
    const double width = config_.design.outerWidth - 2.0 * offset;
    if (length <= config_.design.innerLength || width <= config_.design.innerWidth) {
        return 0.0;
    }
    return length * width;
}

std::vector<double> CoilGeometry::turnLengths(double traceWidth) const {
    const std::size_t turns = maxTurns(traceWidth);
    std::vector<double> lengths;
    lengths.reserve(turns);
    for (std::size_t n = 0; n < turns; ++n) {
        lengths.push_back(turnLength(n, traceWidth));
    }
    return lengths;
}

std::vector<double> CoilGeometry::turnAreas(double traceWidth) const {
    const std::size_t turns = maxTurns(traceWidth);
    std::vector<double> areas;
    areas.reserve(turns);
    for (std::size_t n = 0; n < turns; ++n) {
        areas.push_back(turnArea(n, traceWidth));
    }
    return areas;
}

double CoilGeometry::layerLength(double traceWidth) const {
    const std::size_t turns = maxTurns(traceWidth);
    double total = 0.0;
    for (std::size_t n = 0; n < turns; ++n) {
        total += turnLength(n, traceWidth);
    }
    return total;
}

double CoilGeometry::layerArea(double traceWidth) const {
    const std::size_t turns = maxTurns(traceWidth);
    double total = 0.0;
    for (std::size_t n = 0; n < turns; ++n) {
        total += turnArea(n, traceWidth);
    }
    return total;
}

std::vector<CoilGeometry::PathPoint> CoilGeometry::spiralPath(double traceWidth) const {
    std::vector<PathPoint> path;
    const std::size_t turns = maxTurns(traceWidth);
    if (turns == 0) {
        return path;
    }

    const double turnPitch = pitch(traceWidth);
    // Centre line sits half a trace inside the copper edge.
    const double halfLength = 0.5 * config_.design.outerLength - 0.5 * traceWidth;
    const double halfWidth = 0.5 * config_.design.outerWidth - 0.5 * traceWidth;

    path.reserve(turns * 5);
    for (std::size_t n = 0; n < turns; ++n) {
        const double offset = static_cast<double>(n) * turnPitch;
        const double x0 = -halfWidth + offset;
        const double x1 = halfWidth - offset;
        const double y0 = -halfLength + offset;
        const double y1 = halfLength - offset;
        if (x1 <= x0 || y1 <= y0) {
            break;
        }
        path.push_back({x0, y0, n});
        path.push_back({x1, y0, n});
        path.push_back({x1, y1, n});
        path.push_back({x0, y1, n});
        // Close the loop one pitch higher so the next turn starts inside this one.
        path.push_back({x0, y0 + turnPitch, n});
    }
    return path;
}

}  // namespace mtqdesign
