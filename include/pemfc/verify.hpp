#pragma once

#include <pemfc/operating_point.hpp>
#include <pemfc/stack.hpp>

namespace pemfc {

struct VerificationReport {
  bool flux_ok = false;
  double flux_residual = 0.0;      // max |r2|,|r3| [mol/(m^2 s)]

  // Voltage law |v - N V_cell| and terminal power v*(-I) against N V_cell i A.
  bool voltage_ok = false;
  double voltage_residual = 0.0;   // [V]
  double power_residual = 0.0;     // relative

  // Net power rebuilt from the mass-source enthalpy flows against P_net,
  // and heat flow against port power minus that rebuilt net power.
  bool energy_ok = false;
  double energy_closure = 0.0;     // relative
  double heat_residual = 0.0;      // relative

  bool deterministic = false;      // repeated evaluation is bit-identical

  bool all_ok() const { return flux_ok && voltage_ok && energy_ok && deterministic; }
};

// Chemical power released by the stack, rebuilt from the four mass-source
// commands and the domain enthalpy tables [W].
double source_enthalpy_power(const FuelCellStack& stack, const StackEvaluation& ev);

// Electrical power at the terminals for terminal voltage v [W]; zero unless
// discharging.
double terminal_power(const StackEvaluation& ev, double v);

VerificationReport verify_operating_point(const FuelCellStack& stack,
                                          const StackInputs& in,
                                          const OperatingPoint& op,
                                          double flux_tol);

} // namespace pemfc
