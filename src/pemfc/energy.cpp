#include <pemfc/energy.hpp>

namespace pemfc {

EnergyBalance compute_energy_balance(const CellStackParameters& params,
                                     const DerivedConstants& c,
                                     const GasDomain& anode,
                                     const GasDomain& cathode,
                                     double T,
                                     double i,
                                     double v_cell,
                                     double j_total) {
  EnergyBalance e;
  const double total_area = params.n_cells * params.cell_area;
  e.reaction_rate = total_area * i / (2.0 * c.F);
  e.transport_rate = total_area * j_total;

  const double h_h2 = anode.h_gas.eval(T) * c.M_h2;
  const double h_o2 = cathode.h_gas.eval(T) * c.M_o2;
  const double h_h2o = cathode.h_water.eval(T) * c.M_h2o;

  e.p_reaction = e.reaction_rate * c.lhv;

  // Reactants arrive at T and are cooled to T0; the product leaves at T.
  e.p_sensible = e.reaction_rate * (h_h2 - c.h0_h2)
               + 0.5 * e.reaction_rate * (h_o2 - c.h0_o2)
               - e.reaction_rate * (h_h2o - c.h0_h2o);

  // Removed with anode-domain enthalpy, delivered with cathode-domain enthalpy.
  const double h_h2o_anode = anode.h_water.eval(T) * (c.R / anode.R_water);
  e.p_transport = e.transport_rate * (h_h2o_anode - h_h2o);

  e.p_net = e.p_reaction + e.p_sensible + e.p_transport;
  e.p_electrical = params.n_cells * v_cell * i * params.cell_area;
  e.p_dissipated = e.p_net - e.p_electrical;
  e.heat_flow = -e.p_dissipated;
  return e;
}

} // namespace pemfc
