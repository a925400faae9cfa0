#include <pemfc/verify.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace pemfc {

namespace {

bool same_bits(double a, double b) {
  return std::memcmp(&a, &b, sizeof(double)) == 0;
}

// Enthalpy flow [W] a command delivers into its channel.
double enthalpy_flow(const MassSourceCommand& s, const GasDomain& d) {
  return s.water_mass_flow * d.h_water.eval(s.temperature) + s.gas_mass_flow * d.h_gas.eval(s.temperature);
}

constexpr double kClosureTol = 1e-9;

} // namespace

double source_enthalpy_power(const FuelCellStack& stack, const StackEvaluation& ev) {
  const DerivedConstants& c = stack.constants();
  const StackOutputs& o = ev.outputs;

  const double into_channels = enthalpy_flow(o.anode_moisture, stack.anode_domain())
                             + enthalpy_flow(o.anode_reaction, stack.anode_domain())
                             + enthalpy_flow(o.cathode_moisture, stack.cathode_domain())
                             + enthalpy_flow(o.cathode_reaction, stack.cathode_domain());

  // Reaction heat at T0 on the table enthalpy datum.
  const double h_reaction = c.lhv - c.h0_h2 - 0.5 * c.h0_o2 + c.h0_h2o;
  return o.h2_consumption * h_reaction - into_channels;
}

double terminal_power(const StackEvaluation& ev, double v) {
  if (!(ev.i > 0.0)) return 0.0;
  return -ev.outputs.current * v;
}

VerificationReport verify_operating_point(const FuelCellStack& stack,
                                          const StackInputs& in,
                                          const OperatingPoint& op,
                                          double flux_tol) {
  VerificationReport r;

  const StackEvaluation first = stack.evaluate(in, op.unknowns.activities);
  const ResidualVector res = FuelCellStack::residual_of(first, op.unknowns);

  r.flux_residual = std::max(std::fabs(res[2]), std::fabs(res[3]));
  r.flux_ok = (r.flux_residual <= flux_tol);

  const EnergyBalance& e = first.energy;
  const double p_port = terminal_power(first, op.unknowns.voltage);

  r.voltage_residual = std::fabs(res[0]);
  r.power_residual = std::fabs(p_port - e.p_electrical) / std::max(1.0, std::fabs(e.p_electrical));
  r.voltage_ok = (r.voltage_residual <= kClosureTol * std::max(1.0, std::fabs(op.unknowns.voltage))) &&
                 (r.power_residual <= kClosureTol);

  const double scale = std::max(1.0, std::fabs(e.p_net));
  const double p_chem = source_enthalpy_power(stack, first);
  r.energy_closure = std::fabs(p_chem - e.p_net) / scale;
  r.heat_residual = std::fabs(op.unknowns.heat_flow - (p_port - p_chem)) / scale;
  r.energy_ok = (r.energy_closure <= kClosureTol) && (r.heat_residual <= kClosureTol);

  // Host Jacobians rely on identical outputs for identical inputs.
  const StackEvaluation second = stack.evaluate(in, op.unknowns.activities);
  const ResidualVector res2 = FuelCellStack::residual_of(second, op.unknowns);
  r.deterministic = true;
  for (std::size_t k = 0; k < res.size(); ++k) {
    if (!same_bits(res[k], res2[k])) r.deterministic = false;
  }
  if (!same_bits(first.outputs.voltage, second.outputs.voltage) ||
      !same_bits(first.outputs.heat_flow, second.outputs.heat_flow)) {
    r.deterministic = false;
  }

  return r;
}

} // namespace pemfc
