// filename: optimizer.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mtqdesign/config.hpp"
#include "mtqdesign/feasibility.hpp"

namespace mtqdesign {

enum class SampleSpacing { Linear, Log };

bool tryParseSampleSpacing(const std::string& text, SampleSpacing& out);

struct OptimizeOptions {
    std::size_t samples{2000};
    SampleSpacing spacing{SampleSpacing::Linear};
    std::size_t threads{1};
    bool refine{true};
    std::size_t refineIters{60};
    bool keepSweep{false};
};

/// Summary of one sweep point, kept when OptimizeOptions::keepSweep is set.
struct SweepSample {
    double traceWidth{0.0};
    std::size_t turns{0};
    double resistance{0.0};
    double current{0.0};
    double power{0.0};
    double maxTemperature{0.0};
    double magneticMoment{0.0};
    bool feasible{false};
};

struct OptimizationResult {
    bool found{false};
    double traceWidth{0.0};
    double magneticMoment{0.0};
    std::size_t samplesEvaluated{0};
    std::size_t feasibleSamples{0};
    std::size_t bestSampleIndex{0};
    bool refined{false};
    std::vector<SweepSample> sweep;
};

/**
 * @brief Deterministic sample widths covering [minWidth, maxWidth], both ends included.
 *
 * A degenerate range (minWidth == maxWidth) or a count of 1 yields the single width minWidth.
 */
std::vector<double> sampleTraceWidths(double minWidth, double maxWidth, std::size_t count,
                                      SampleSpacing spacing);

/**
 * @brief Pick the trace width with the largest feasible magnetic moment.
 *
 * A dense sweep selects the winner (ties go to the smallest width); a golden-section search
 * between the winner's neighbours may then improve it. The result does not depend on the
 * thread count. Returns found == false when no sample is feasible. ThermalSolverError aborts
 * the run.
 */
OptimizationResult optimizeTraceWidth(const DesignConfig& config, const OptimizeOptions& options = {});

}  // namespace mtqdesign
