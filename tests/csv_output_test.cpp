#include "mtqdesign/mtqdesign.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

int main() {
    using namespace mtqdesign;
    namespace fs = std::filesystem;

    const fs::path configPath =
        (fs::path(__FILE__).parent_path() / "../inputs/tests/square_board_wide_range.json").lexically_normal();

    DesignConfig config;
    try {
        config = loadConfigFromJson(configPath.string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load wide-range config: " << ex.what() << '\n';
        return 1;
    }

    OptimizeOptions options{};
    options.samples = 50;
    options.refine = false;
    options.keepSweep = true;
    const OptimizationResult result = optimizeTraceWidth(config, options);

    const fs::path outDir = fs::temp_directory_path() / "mtqdesign_csv_output_test";
    std::error_code ec;
    fs::create_directories(outDir, ec);
    const fs::path sweepPath = outDir / "sweep.csv";
    const fs::path spiralPath = outDir / "spiral.csv";

    try {
        write_csv_sweep(sweepPath.string(), result.sweep);
        write_csv_spiral_path(spiralPath.string(), CoilGeometry(config).spiralPath(result.traceWidth));
    } catch (const std::exception& ex) {
        std::cerr << "CSV output failed: " << ex.what() << '\n';
        return 1;
    }

    const auto sweepLines = readLines(sweepPath);
    if (sweepLines.size() != 51 || sweepLines.front().rfind("trace_width,turns,", 0) != 0) {
        std::cerr << "Sweep CSV should hold a header and 50 rows, got " << sweepLines.size() << " lines" << '\n';
        return 1;
    }
    std::size_t feasibleRows = 0;
    for (std::size_t i = 1; i < sweepLines.size(); ++i) {
        if (sweepLines[i].back() == '1') {
            ++feasibleRows;
        }
    }
    if (feasibleRows != result.feasibleSamples) {
        std::cerr << "Sweep CSV feasible flags disagree with the optimizer" << '\n';
        return 1;
    }

    const auto spiralLines = readLines(spiralPath);
    const std::size_t turns = CoilGeometry(config).maxTurns(result.traceWidth);
    if (spiralLines.size() != 5 * turns + 1 || spiralLines.front() != "turn,x_mm,y_mm") {
        std::cerr << "Spiral CSV should hold five vertices per turn" << '\n';
        return 1;
    }
    std::istringstream first(spiralLines[1]);
    std::string turnField;
    std::string xField;
    std::getline(first, turnField, ',');
    std::getline(first, xField, ',');
    const double x = std::stod(xField);
    if (turnField != "0" || x > -49.0 || x < -50.0) {
        std::cerr << "Spiral should start on turn 0 near the outer edge, got x=" << x << " mm" << '\n';
        return 1;
    }

    fs::remove_all(outDir, ec);
    std::cout << "CSV outputs verified successfully" << '\n';
    return 0;
}
