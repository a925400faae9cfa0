#include <pemfc/stack.hpp>

#include <utility>

namespace pemfc {

FuelCellStack::FuelCellStack(CellStackParameters params, GasDomain anode, GasDomain cathode)
    : params_(std::move(params)), anode_(std::move(anode)), cathode_(std::move(cathode)) {
  constants_ = derive_constants(params_, anode_, cathode_);
}

StackEvaluation FuelCellStack::evaluate(const StackInputs& in, const UnknownActivities& x) const {
  const DerivedConstants& c = constants_;
  StackEvaluation ev;
  ev.T = in.T_stack;
  ev.i = current_density(in.current, params_.cell_area);

  ev.anode = extract_channel_state(in.anode, anode_, ev.T, c);
  ev.cathode = extract_channel_state(in.cathode, cathode_, ev.T, c);

  // Darcy flow carries the upstream gas.
  const GasDomain& upstream = (ev.anode.p >= ev.cathode.p) ? anode_ : cathode_;
  const double mu = upstream.mu_water.eval(ev.T);
  ev.membrane = compute_membrane_transport(params_, c, ev.T, ev.i, x, ev.anode, ev.cathode, mu);

  ev.voltage = compute_cell_voltage(params_, c, ev.T, ev.i, ev.anode.a_gas, ev.cathode.a_gas,
                                    ev.cathode.a_h2o, ev.membrane.resistance);

  ev.j_gdl_anode = gdl_vapor_flux(params_.gdl_vapor_diffusivity, params_.gdl_thickness,
                                  anode_.saturation_pressure(ev.T), ev.T, ev.anode.a_h2o, x.a_acl);
  ev.j_gdl_cathode = gdl_vapor_flux(params_.gdl_vapor_diffusivity, params_.gdl_thickness,
                                    cathode_.saturation_pressure(ev.T), ev.T, x.a_ccl, ev.cathode.a_h2o);
  ev.j_production = ev.i / (2.0 * c.F);

  ev.energy = compute_energy_balance(params_, c, anode_, cathode_, ev.T, ev.i, ev.voltage.cell,
                                     ev.membrane.j_total);

  StackOutputs& o = ev.outputs;
  o.current = in.current;
  o.voltage = params_.n_cells * ev.voltage.cell;
  o.heat_flow = ev.energy.heat_flow;

  const double rate = ev.energy.reaction_rate;
  o.h2_consumption = rate;
  o.o2_consumption = 0.5 * rate;
  o.h2o_production = rate;

  const double M_h2o_anode = c.R / anode_.R_water;
  o.anode_moisture.water_mass_flow = -ev.energy.transport_rate * M_h2o_anode;
  o.anode_moisture.temperature = ev.T;
  o.cathode_moisture.water_mass_flow = ev.energy.transport_rate * c.M_h2o;
  o.cathode_moisture.temperature = ev.T;

  o.anode_reaction.gas_mass_flow = -rate * c.M_h2;
  o.anode_reaction.temperature = ev.T;
  o.cathode_reaction.gas_mass_flow = -0.5 * rate * c.M_o2;
  o.cathode_reaction.water_mass_flow = rate * c.M_h2o;
  o.cathode_reaction.temperature = ev.T;

  return ev;
}

ResidualVector FuelCellStack::residual_of(const StackEvaluation& ev, const StackUnknowns& x) {
  const double j_total = ev.membrane.j_total;
  return {x.voltage - ev.outputs.voltage,
          x.heat_flow + ev.energy.p_dissipated,
          ev.j_gdl_anode - j_total,
          ev.j_gdl_cathode - (j_total + ev.j_production)};
}

ResidualVector FuelCellStack::residual(const StackInputs& in, const StackUnknowns& x) const {
  return residual_of(evaluate(in, x.activities), x);
}

FuelCellStack build_stack(const StackConfig& cfg) {
  GasDomain anode = apply_overrides(moist_hydrogen_domain(), cfg.anode_props, cfg.extrapolation);
  GasDomain cathode = apply_overrides(moist_air_domain(), cfg.cathode_props, cfg.extrapolation);
  return FuelCellStack(cfg.params, std::move(anode), std::move(cathode));
}

} // namespace pemfc
