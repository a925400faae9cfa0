#pragma once

#include <pemfc/config.hpp>
#include <pemfc/electrochem.hpp>
#include <pemfc/energy.hpp>
#include <pemfc/gas_properties.hpp>
#include <pemfc/membrane.hpp>
#include <pemfc/stack_constants.hpp>
#include <pemfc/state.hpp>
#include <pemfc/types.hpp>

#include <array>

namespace pemfc {

// Command to one internal mass source. Positive flows enter the channel.
struct MassSourceCommand {
  double water_mass_flow = 0.0;  // [kg/s]
  double gas_mass_flow = 0.0;    // trace gas [kg/s]
  double temperature = 0.0;      // [K]
};

struct StackOutputs {
  double current = 0.0;          // branch current [A]
  double voltage = 0.0;          // terminal voltage N V_cell [V]
  double heat_flow = 0.0;        // into the component [W]

  double h2_consumption = 0.0;   // [mol/s]
  double o2_consumption = 0.0;   // [mol/s]
  double h2o_production = 0.0;   // [mol/s]

  MassSourceCommand anode_moisture;
  MassSourceCommand cathode_moisture;
  MassSourceCommand anode_reaction;
  MassSourceCommand cathode_reaction;
};

// Everything one evaluation derives from inputs and candidate activities.
struct StackEvaluation {
  double i = 0.0;                // current density [A/m^2]
  double T = 0.0;                // stack temperature [K]

  ChannelState anode;
  ChannelState cathode;
  VoltageBreakdown voltage;
  MembraneTransport membrane;

  double j_gdl_anode = 0.0;      // channel -> ACL [mol/(m^2 s)]
  double j_gdl_cathode = 0.0;    // CCL -> channel [mol/(m^2 s)]
  double j_production = 0.0;     // i/(2F) [mol/(m^2 s)]

  EnergyBalance energy;
  StackOutputs outputs;
};

// Solved variables of the component: [v, Q, a_ACL, a_CCL].
struct StackUnknowns {
  double voltage = 0.0;
  double heat_flow = 0.0;
  UnknownActivities activities;
};

// [v - N V_cell, Q + P_diss, anode flux balance, cathode flux balance]
using ResidualVector = std::array<double, 4>;

class FuelCellStack {
public:
  // Validates the parameters (ConfigurationError) and derives all constants.
  FuelCellStack(CellStackParameters params, GasDomain anode, GasDomain cathode);

  const CellStackParameters& params() const { return params_; }
  const DerivedConstants& constants() const { return constants_; }
  const GasDomain& anode_domain() const { return anode_; }
  const GasDomain& cathode_domain() const { return cathode_; }

  StackEvaluation evaluate(const StackInputs& in, const UnknownActivities& x) const;

  ResidualVector residual(const StackInputs& in, const StackUnknowns& x) const;

  static ResidualVector residual_of(const StackEvaluation& ev, const StackUnknowns& x);

private:
  CellStackParameters params_;
  GasDomain anode_;
  GasDomain cathode_;
  DerivedConstants constants_;
};

// Stack with the built-in gas domains, overridden from [properties].
FuelCellStack build_stack(const StackConfig& cfg);

} // namespace pemfc
