// filename: io_csv.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

#include <string>
#include <vector>

#include "mtqdesign/geometry.hpp"
#include "mtqdesign/optimizer.hpp"

namespace mtqdesign {

/// One row per sweep sample: width in metres, SI electrical values, moment 0 when infeasible.
void write_csv_sweep(const std::string& path, const std::vector<SweepSample>& samples);

/// Spiral centre-line of one coil layer, coordinates in millimetres.
void write_csv_spiral_path(const std::string& path, const std::vector<CoilGeometry::PathPoint>& points);

}  // namespace mtqdesign
