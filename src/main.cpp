#include "mtqdesign/config.hpp"
#include "mtqdesign/errors.hpp"
#include "mtqdesign/geometry.hpp"
#include "mtqdesign/io_csv.hpp"
#include "mtqdesign/optimizer.hpp"
#include "mtqdesign/record_io.hpp"
#include "mtqdesign/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace {

void printUsage() {
    std::cout << "Usage: mtq_design --config PATH [--output PATH] [--samples N]"
                 " [--spacing {linear|log}] [--threads N] [--no-refine]"
                 " [--sweep-csv PATH] [--spiral-csv PATH] [--quiet]\n";
}

void ensureParentDirectory(const std::filesystem::path& path) {
    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

bool parseCount(const std::string& flag, const char* text, std::size_t& out) {
    long long value = 0;
    try {
        value = std::stoll(text);
    } catch (const std::exception&) {
        std::cerr << flag << " requires a valid integer argument\n";
        return false;
    }
    if (value <= 0) {
        std::cerr << flag << " must be positive\n";
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace mtqdesign;

    std::optional<std::string> configPath;
    std::optional<std::string> outputPath;
    std::optional<std::string> sweepCsvPath;
    std::optional<std::string> spiralCsvPath;
    bool quiet = false;
    OptimizeOptions options{};

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a path argument\n";
                printUsage();
                return 1;
            }
            configPath = std::string(argv[++i]);
        } else if (arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "--output requires a path argument\n";
                printUsage();
                return 1;
            }
            outputPath = std::string(argv[++i]);
        } else if (arg == "--samples") {
            if (i + 1 >= argc) {
                std::cerr << "--samples requires an integer argument\n";
                printUsage();
                return 1;
            }
            if (!parseCount("--samples", argv[++i], options.samples)) {
                return 1;
            }
        } else if (arg == "--spacing") {
            if (i + 1 >= argc) {
                std::cerr << "--spacing requires an argument (linear or log)\n";
                printUsage();
                return 1;
            }
            if (!tryParseSampleSpacing(argv[++i], options.spacing)) {
                std::cerr << "--spacing must be 'linear' or 'log'\n";
                return 1;
            }
        } else if (arg == "--threads") {
            if (i + 1 >= argc) {
                std::cerr << "--threads requires an integer argument\n";
                printUsage();
                return 1;
            }
            if (!parseCount("--threads", argv[++i], options.threads)) {
                return 1;
            }
        } else if (arg == "--no-refine") {
            options.refine = false;
        } else if (arg == "--sweep-csv") {
            if (i + 1 >= argc) {
                std::cerr << "--sweep-csv requires a path argument\n";
                printUsage();
                return 1;
            }
            sweepCsvPath = std::string(argv[++i]);
        } else if (arg == "--spiral-csv") {
            if (i + 1 >= argc) {
                std::cerr << "--spiral-csv requires a path argument\n";
                printUsage();
                return 1;
            }
            spiralCsvPath = std::string(argv[++i]);
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (!configPath) {
        std::cerr << "--config is required\n";
        printUsage();
        return 1;
    }

    const unsigned int hw = std::thread::hardware_concurrency();
    if (hw > 0 && options.threads > hw) {
        if (!quiet) {
            std::cerr << "Requested " << options.threads << " threads; limiting to " << hw << "\n";
        }
        options.threads = hw;
    }
    options.keepSweep = sweepCsvPath.has_value();

    // The record goes to stdout unless --output is given; keep progress off that stream.
    std::ostream& log = outputPath ? std::cout : std::cerr;

    DesignConfig config;
    try {
        config = loadConfigFromJson(*configPath);
    } catch (const ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load configuration " << *configPath << ": " << ex.what() << "\n";
        return 1;
    }

    if (!quiet) {
        log << "Loaded configuration " << *configPath << " (" << config.design.numLayers << " layers, "
            << config.design.voltage << " V, " << config.design.maxPower << " W budget)\n";
        log << "Sweeping " << options.samples << " trace widths in ["
            << config.manufacturing.minTraceWidth * 1e3 << ", " << config.manufacturing.maxTraceWidth * 1e3
            << "] mm with " << options.threads << " thread" << (options.threads == 1 ? "" : "s") << "\n";
    }

    const auto start = std::chrono::steady_clock::now();
    OptimizationResult optimization;
    DesignResult result;
    try {
        optimization = optimizeTraceWidth(config, options);
        result = analyzeResult(config, optimization);
    } catch (const ThermalSolverError& ex) {
        std::cerr << "Thermal model failure: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Optimization failed: " << ex.what() << "\n";
        return 2;
    }
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!quiet) {
        log << "Evaluated " << optimization.samplesEvaluated << " samples (" << optimization.feasibleSamples
            << " feasible) in " << elapsed << " s";
        if (optimization.refined) {
            log << "; refined around sample " << optimization.bestSampleIndex;
        }
        log << "\n";
        if (!optimization.found) {
            log << "No feasible trace width found; emitting zero design record\n";
        }
    }

    const DesignRecord record = makeDesignRecord(result);

    try {
        if (outputPath) {
            const std::filesystem::path path(*outputPath);
            ensureParentDirectory(path);
            writeDesignRecord(path.string(), record);
            if (!quiet) {
                std::cout << "Wrote design record to " << path.string() << "\n";
            }
        } else {
            std::cout << designRecordToJson(record).dump(2) << "\n";
        }

        if (sweepCsvPath) {
            const std::filesystem::path path(*sweepCsvPath);
            ensureParentDirectory(path);
            write_csv_sweep(path.string(), optimization.sweep);
            if (!quiet) {
                log << "Wrote sweep samples to " << path.string() << "\n";
            }
        }

        if (spiralCsvPath) {
            const std::filesystem::path path(*spiralCsvPath);
            ensureParentDirectory(path);
            const CoilGeometry geometry(config);
            write_csv_spiral_path(path.string(), geometry.spiralPath(result.candidate.traceWidth));
            if (!quiet) {
                log << "Wrote spiral path to " << path.string() << "\n";
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to write outputs: " << ex.what() << "\n";
        return 1;
    }

    if (!quiet && outputPath) {
        std::cout << "\n" << formatDesignSummary(record);
    }
    return 0;
}
