#include <pemfc/stack_constants.hpp>

#include <pemfc/config.hpp>
#include <pemfc/constants.hpp>

#include <stdexcept>

namespace pemfc {

DerivedConstants derive_constants(const CellStackParameters& params,
                                  const GasDomain& anode,
                                  const GasDomain& cathode) {
  validate_parameters(params);
  if (anode.trace_gas != "h2") {
    throw std::runtime_error("Anode domain must carry h2 as trace gas, got '" + anode.trace_gas + "'");
  }
  if (cathode.trace_gas != "o2") {
    throw std::runtime_error("Cathode domain must carry o2 as trace gas, got '" + cathode.trace_gas + "'");
  }

  DerivedConstants c;
  c.R = kGasConstant;
  c.F = kFaraday;
  c.T0 = kStandardTemperature;
  c.p0 = kStandardPressure;

  // M = R / R_specific
  c.M_h2o = c.R / cathode.R_water;
  c.M_h2 = c.R / anode.R_gas;
  c.M_o2 = c.R / cathode.R_gas;

  c.gibbs_formation = kGibbsWaterFormation;
  c.hhv = kHigherHeatingValue;
  c.lhv = c.hhv - cathode.h_fg.eval(c.T0) * c.M_h2o;
  c.E0 = -c.gibbs_formation / (2.0 * c.F);

  c.permeability = params.permeability;
  c.fixed_charge = params.dry_density / params.equivalent_weight;

  c.h0_h2o = cathode.h_water.eval(c.T0) * c.M_h2o;
  c.h0_h2 = anode.h_gas.eval(c.T0) * c.M_h2;
  c.h0_o2 = cathode.h_gas.eval(c.T0) * c.M_o2;

  return c;
}

} // namespace pemfc
