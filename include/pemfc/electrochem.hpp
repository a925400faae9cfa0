#pragma once

#include <pemfc/stack_constants.hpp>
#include <pemfc/types.hpp>

namespace pemfc {

struct VoltageBreakdown {
  double nernst = 0.0;         // [V]
  double activation = 0.0;     // [V]
  double ohmic = 0.0;          // [V]
  double concentration = 0.0;  // [V]
  double cell = 0.0;           // nernst - losses [V]
};

// Discharge-only convention: i = -I/A for I <= 0, otherwise 0. [A/m^2]
double current_density(double branch_current, double cell_area);

// E0 + RT/(2F) ln(a_H2 sqrt(a_O2) / a_H2O)
double nernst_voltage(double E0, double T, double a_h2, double a_o2, double a_h2o);

// Tafel form b ln(i/io), b = RT/(2 alpha F); exactly zero for i < io.
double activation_loss(double i, double io, double alpha, double T);

// RT/(2F) ln(iL/(iL - i)) up to 0.999 iL, continued linearly beyond with the
// slope at that anchor.
double concentration_loss(double i, double iL, double T);

// resistance [Ohm m^2] * i [A/m^2]
double ohmic_loss(double i, double resistance);

VoltageBreakdown compute_cell_voltage(const CellStackParameters& params,
                                      const DerivedConstants& c,
                                      double T,
                                      double i,
                                      double a_h2,
                                      double a_o2,
                                      double a_h2o,
                                      double resistance);

} // namespace pemfc
