// filename: types.hpp
// part of PCB Magnetorquer Designer
// MIT License

#pragma once

namespace mtqdesign {

constexpr double MU0 = 4.0e-7 * 3.14159265358979323846;
constexpr double STEFAN_BOLTZMANN = 5.670374419e-8;  // W/(m^2 K^4)
constexpr double CELSIUS_TO_KELVIN = 273.15;

}  // namespace mtqdesign
