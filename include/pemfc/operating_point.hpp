#pragma once

#include <pemfc/config.hpp>
#include <pemfc/stack.hpp>
#include <pemfc/types.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace pemfc {

struct OperatingPoint {
  double current_density = 0.0;  // [A/m^2]
  int iterations = 0;
  bool converged = false;
  double residual_norm = 0.0;    // max |r| over the two flux equations

  StackUnknowns unknowns;
  StackEvaluation evaluation;
};

// Host-side damped Newton iteration on the two catalyst-layer activities
// with a central finite-difference Jacobian. Voltage and heat flow are then
// set so the first two residuals vanish. Failure to converge is reported in
// the result, never thrown.
OperatingPoint solve_operating_point(const FuelCellStack& stack,
                                     const StackInputs& in,
                                     const SolverOptions& opt);

// Independent operating points for each discharge current density [A/m^2].
// Results keep the order of current_densities.
std::vector<OperatingPoint> polarization_curve(const FuelCellStack& stack,
                                               const StackInputs& base,
                                               const std::vector<double>& current_densities,
                                               const SolverOptions& opt);

std::vector<double> linspace(double a, double b, std::size_t n);

void write_operating_point_outputs(const StackConfig& cfg,
                                   const OperatingPoint& op,
                                   const std::string& subdir = "");

void write_polarization_outputs(const StackConfig& cfg,
                                const std::vector<OperatingPoint>& curve,
                                const std::string& subdir = "");

} // namespace pemfc
