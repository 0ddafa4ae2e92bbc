// filename: io_csv.cpp
// part of PCB Magnetorquer Designer
// MIT License

#include "mtqdesign/io_csv.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace mtqdesign {

void write_csv_sweep(const std::string& path, const std::vector<SweepSample>& samples) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
    ofs << "trace_width,turns,resistance,current,power,max_temperature,magnetic_moment,feasible\n";
    for (const auto& sample : samples) {
        ofs << sample.traceWidth << ',' << sample.turns << ',' << sample.resistance << ',' << sample.current
            << ',' << sample.power << ',' << sample.maxTemperature << ',' << sample.magneticMoment << ','
            << (sample.feasible ? 1 : 0) << '\n';
    }
}

void write_csv_spiral_path(const std::string& path, const std::vector<CoilGeometry::PathPoint>& points) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    ofs << "turn,x_mm,y_mm\n";
    for (const auto& point : points) {
        ofs << point.turn << ',' << point.x * 1e3 << ',' << point.y * 1e3 << '\n';
    }
}

}  // namespace mtqdesign
