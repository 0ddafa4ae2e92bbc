// filename: mtqdesign.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

#include "config.hpp"
#include "electrical.hpp"
#include "errors.hpp"
#include "feasibility.hpp"
#include "geometry.hpp"
#include "io_csv.hpp"
#include "optimizer.hpp"
#include "record_io.hpp"
#include "result.hpp"
#include "thermal.hpp"
#include "types.hpp"
