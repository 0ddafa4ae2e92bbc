// filename: optimizer.cpp
// part of PCB Magnetorquer Designer
// MIT License

#include "mtqdesign/optimizer.hpp"

#include "mtqdesign/feasibility.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mtqdesign {
namespace {

constexpr double kInvGoldenRatio = 0.61803398874989484820;

SweepSample summarize(const Candidate& candidate) {
    SweepSample sample{};
    sample.traceWidth = candidate.traceWidth;
    sample.turns = candidate.turns;
    sample.resistance = candidate.resistance;
    sample.current = candidate.current.current;
    sample.power = candidate.power;
    for (const auto& entry : candidate.temperatures) {
        sample.maxTemperature = std::max(sample.maxTemperature, entry.finalTemperature);
    }
    sample.magneticMoment = candidate.objective();
    sample.feasible = candidate.feasible();
    return sample;
}

std::vector<SweepSample> evaluateSweep(const CandidateEvaluator& evaluator, const std::vector<double>& widths,
                                       std::size_t threadCount) {
    std::vector<SweepSample> results(widths.size());
    if (threadCount <= 1 || widths.size() < 2) {
        for (std::size_t idx = 0; idx < widths.size(); ++idx) {
            results[idx] = summarize(evaluator.evaluate(widths[idx]));
        }
        return results;
    }

    threadCount = std::min(threadCount, widths.size());
    std::atomic<std::size_t> nextIndex{0};
    std::atomic<bool> abort{false};
    std::exception_ptr failure;
    std::mutex failureMutex;

    std::vector<std::thread> workers;
    workers.reserve(threadCount);
    for (std::size_t t = 0; t < threadCount; ++t) {
        workers.emplace_back([&]() {
            while (!abort.load()) {
                const std::size_t idx = nextIndex.fetch_add(1);
                if (idx >= widths.size()) {
                    break;
                }
                try {
                    results[idx] = summarize(evaluator.evaluate(widths[idx]));
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failureMutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                    abort.store(true);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    return results;
}

// Golden-section search for the largest objective on [lo, hi]; returns the best point seen.
Candidate refineBracket(const CandidateEvaluator& evaluator, double lo, double hi, std::size_t iters) {
    Candidate best = evaluator.evaluate(lo);
    auto consider = [&best](Candidate&& candidate) {
        if (candidate.objective() > best.objective()) {
            best = std::move(candidate);
        }
    };
    consider(evaluator.evaluate(hi));

    double a = lo;
    double b = hi;
    double c = b - kInvGoldenRatio * (b - a);
    double d = a + kInvGoldenRatio * (b - a);
    Candidate fc = evaluator.evaluate(c);
    Candidate fd = evaluator.evaluate(d);
    for (std::size_t iter = 0; iter < iters && (b - a) > 0.0; ++iter) {
        if (fc.objective() >= fd.objective()) {
            b = d;
            d = c;
            consider(std::move(fd));
            fd = std::move(fc);
            c = b - kInvGoldenRatio * (b - a);
            fc = evaluator.evaluate(c);
        } else {
            a = c;
            c = d;
            consider(std::move(fc));
            fc = std::move(fd);
            d = a + kInvGoldenRatio * (b - a);
            fd = evaluator.evaluate(d);
        }
    }
    consider(std::move(fc));
    consider(std::move(fd));
    return best;
}

}  // namespace

bool tryParseSampleSpacing(const std::string& text, SampleSpacing& out) {
    if (text == "linear") {
        out = SampleSpacing::Linear;
        return true;
    }
    if (text == "log") {
        out = SampleSpacing::Log;
        return true;
    }
    return false;
}

std::vector<double> sampleTraceWidths(double minWidth, double maxWidth, std::size_t count,
                                      SampleSpacing spacing) {
    if (count == 0) {
        throw std::invalid_argument("sampleTraceWidths: count must be positive");
    }
    if (maxWidth < minWidth) {
        throw std::invalid_argument("sampleTraceWidths: maxWidth below minWidth");
    }
    if (spacing == SampleSpacing::Log && !(minWidth > 0.0)) {
        throw std::invalid_argument("sampleTraceWidths: log spacing needs a positive minWidth");
    }

    if (count == 1 || maxWidth == minWidth) {
        return {minWidth};
    }

    std::vector<double> widths(count);
    const double denom = static_cast<double>(count - 1);
    if (spacing == SampleSpacing::Linear) {
        const double step = (maxWidth - minWidth) / denom;
        for (std::size_t i = 0; i < count; ++i) {
            widths[i] = minWidth + step * static_cast<double>(i);
        }
    } else {
        const double logMin = std::log(minWidth);
        const double logStep = (std::log(maxWidth) - logMin) / denom;
        for (std::size_t i = 0; i < count; ++i) {
            widths[i] = std::exp(logMin + logStep * static_cast<double>(i));
        }
    }
    // Pin both ends exactly so the manufacturing bound check never rejects them.
    widths.front() = minWidth;
    widths.back() = maxWidth;
    return widths;
}

OptimizationResult optimizeTraceWidth(const DesignConfig& config, const OptimizeOptions& options) {
    const CandidateEvaluator evaluator(config);
    const std::vector<double> widths = sampleTraceWidths(config.manufacturing.minTraceWidth,
                                                         config.manufacturing.maxTraceWidth,
                                                         std::max<std::size_t>(1, options.samples), options.spacing);

    std::vector<SweepSample> sweep = evaluateSweep(evaluator, widths, options.threads);

    OptimizationResult result{};
    result.samplesEvaluated = sweep.size();
    for (std::size_t idx = 0; idx < sweep.size(); ++idx) {
        const auto& sample = sweep[idx];
        if (!sample.feasible) {
            continue;
        }
        ++result.feasibleSamples;
        // Strictly greater keeps the first (smallest-width) sample on ties.
        if (!result.found || sample.magneticMoment > result.magneticMoment) {
            result.found = true;
            result.bestSampleIndex = idx;
            result.traceWidth = sample.traceWidth;
            result.magneticMoment = sample.magneticMoment;
        }
    }

    if (result.found && options.refine && options.refineIters > 0 && widths.size() > 1) {
        const std::size_t idx = result.bestSampleIndex;
        const double lo = widths[idx == 0 ? 0 : idx - 1];
        const double hi = widths[std::min(idx + 1, widths.size() - 1)];
        const Candidate refined = refineBracket(evaluator, lo, hi, options.refineIters);
        if (refined.feasible() && refined.magneticMoment > result.magneticMoment) {
            result.traceWidth = refined.traceWidth;
            result.magneticMoment = refined.magneticMoment;
            result.refined = true;
        }
    }

    if (options.keepSweep) {
        result.sweep = std::move(sweep);
    }
    return result;
}

}  // namespace mtqdesign
