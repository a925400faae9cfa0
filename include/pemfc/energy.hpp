#pragma once

#include <pemfc/gas_properties.hpp>
#include <pemfc/stack_constants.hpp>
#include <pemfc/types.hpp>

namespace pemfc {

struct EnergyBalance {
  double reaction_rate = 0.0;   // H2 consumed by the stack [mol/s]
  double transport_rate = 0.0;  // water carried anode->cathode by the stack [mol/s]

  double p_reaction = 0.0;      // reaction_rate * LHV at T0 [W]
  double p_sensible = 0.0;      // bringing reactants/product between T and T0 [W]
  double p_transport = 0.0;     // enthalpy carried by the transported water [W]
  double p_net = 0.0;           // sum of the above [W]

  double p_electrical = 0.0;    // N V_cell i A [W]
  double p_dissipated = 0.0;    // p_net - p_electrical [W]
  double heat_flow = 0.0;       // -p_dissipated, into the component [W]
};

EnergyBalance compute_energy_balance(const CellStackParameters& params,
                                     const DerivedConstants& c,
                                     const GasDomain& anode,
                                     const GasDomain& cathode,
                                     double T,
                                     double i,
                                     double v_cell,
                                     double j_total);

} // namespace pemfc
