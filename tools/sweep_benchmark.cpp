// filename: sweep_benchmark.cpp
// part of PCB Magnetorquer Designer
// MIT License

#include "mtqdesign/config.hpp"
#include "mtqdesign/optimizer.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct BenchmarkConfig {
    std::string configPath{};
    std::size_t samples{2000};
    std::size_t threads{1};
    std::size_t repeats{3};
    bool refine{true};
    bool logSpacing{false};
    bool writeCsv{false};
    std::string csvPath{};
};

void printUsage() {
    std::cout << "sweep_benchmark options:\n"
              << "  --config <path>        Design constraints JSON (required)\n"
              << "  --samples <int>        Sweep sample count (default 2000)\n"
              << "  --threads <int>        Worker threads (default 1)\n"
              << "  --repeats <int>        Number of benchmark repeats (default 3)\n"
              << "  --log-spacing          Log-spaced samples instead of linear\n"
              << "  --no-refine            Skip the golden-section fine-tune\n"
              << "  --csv <path>           Append benchmark results to CSV file\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, BenchmarkConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--config" && i + 1 < argc) {
                cfg.configPath = argv[++i];
            } else if (arg == "--samples" && i + 1 < argc) {
                cfg.samples = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--threads" && i + 1 < argc) {
                cfg.threads = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--repeats" && i + 1 < argc) {
                cfg.repeats = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--log-spacing") {
                cfg.logSpacing = true;
            } else if (arg == "--no-refine") {
                cfg.refine = false;
            } else if (arg == "--csv" && i + 1 < argc) {
                cfg.writeCsv = true;
                cfg.csvPath = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to parse argument " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

void writeCsvResult(const BenchmarkConfig& cfg,
                    const mtqdesign::OptimizationResult& result,
                    double avgMs,
                    double minMs,
                    double maxMs) {
    namespace fs = std::filesystem;
    const fs::path csvPath{cfg.csvPath};
    const bool newFile = !fs::exists(csvPath);
    std::ofstream csv(csvPath, std::ios::app);
    if (!csv) {
        throw std::runtime_error("Failed to open CSV file: " + cfg.csvPath);
    }
    if (newFile) {
        csv << "samples,threads,spacing,refine,feasible,trace_width,magnetic_moment,avg_ms,min_ms,max_ms\n";
    }
    csv << cfg.samples << ',' << cfg.threads << ',' << (cfg.logSpacing ? "log" : "linear") << ','
        << (cfg.refine ? 1 : 0) << ',' << result.feasibleSamples << ',' << result.traceWidth << ','
        << result.magneticMoment << ',' << avgMs << ',' << minMs << ',' << maxMs << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    BenchmarkConfig cfg{};
    if (!parseArgs(argc, argv, cfg)) {
        return 1;
    }
    if (cfg.configPath.empty()) {
        std::cerr << "--config is required\n";
        printUsage();
        return 1;
    }
    if (cfg.samples == 0 || cfg.threads == 0 || cfg.repeats == 0) {
        std::cerr << "--samples, --threads and --repeats must be positive\n";
        return 1;
    }

    mtqdesign::DesignConfig config;
    try {
        config = mtqdesign::loadConfigFromJson(cfg.configPath);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load configuration: " << ex.what() << "\n";
        return 1;
    }

    mtqdesign::OptimizeOptions options{};
    options.samples = cfg.samples;
    options.threads = cfg.threads;
    options.refine = cfg.refine;
    options.spacing = cfg.logSpacing ? mtqdesign::SampleSpacing::Log : mtqdesign::SampleSpacing::Linear;

    std::vector<double> durationsMs;
    durationsMs.reserve(cfg.repeats);
    mtqdesign::OptimizationResult result{};

    try {
        for (std::size_t repeat = 0; repeat < cfg.repeats; ++repeat) {
            const auto start = std::chrono::steady_clock::now();
            result = mtqdesign::optimizeTraceWidth(config, options);
            const auto end = std::chrono::steady_clock::now();
            durationsMs.push_back(std::chrono::duration<double, std::milli>(end - start).count());
        }
    } catch (const std::exception& ex) {
        std::cerr << "Optimization failed: " << ex.what() << "\n";
        return 2;
    }

    const double avgMs = std::accumulate(durationsMs.begin(), durationsMs.end(), 0.0) /
                         static_cast<double>(durationsMs.size());
    const auto [minIt, maxIt] = std::minmax_element(durationsMs.begin(), durationsMs.end());
    const double minMs = *minIt;
    const double maxMs = *maxIt;
    const double samplesPerSecond = static_cast<double>(result.samplesEvaluated) / (avgMs / 1000.0);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Samples: " << result.samplesEvaluated << " (" << result.feasibleSamples << " feasible), threads="
              << cfg.threads << "\n";
    std::cout << "Average sweep time: " << avgMs << " ms (min=" << minMs << " ms, max=" << maxMs << " ms)\n";
    std::cout << "Throughput: " << samplesPerSecond << " candidates/s\n";
    if (result.found) {
        std::cout << "Best width: " << result.traceWidth * 1e3 << " mm, moment=" << std::setprecision(4)
                  << result.magneticMoment << " A m^2" << (result.refined ? " (refined)" : "") << '\n';
    } else {
        std::cout << "No feasible width\n";
    }

    if (cfg.writeCsv) {
        try {
            writeCsvResult(cfg, result, avgMs, minMs, maxMs);
        } catch (const std::exception& ex) {
            std::cerr << "Warning: " << ex.what() << "\n";
        }
    }

    return 0;
}
