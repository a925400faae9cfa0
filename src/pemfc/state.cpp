#include <pemfc/state.hpp>

#include <pemfc/constants.hpp>

#include <cmath>

namespace pemfc {

GasState GasState::from_flow_vector(const FlowStateVector& v) {
  GasState g;
  g.p = v[flow_index::pressure];
  g.T = v[flow_index::temperature];
  g.x_h2o = v[flow_index::water_mole_fraction];
  g.x_gas = v[flow_index::gas_mole_fraction];
  return g;
}

double clamp_activity(double a) {
  if (a < kActivityThreshold) return kActivityFloor;
  return a;
}

ChannelState extract_channel_state(const PortSamples& port,
                                   const GasDomain& domain,
                                   double T,
                                   const DerivedConstants& c) {
  ChannelState s;
  s.p = 0.5 * (port.inflow.p + port.outflow.p);
  s.x_h2o = 0.5 * (port.inflow.x_h2o + port.outflow.x_h2o);
  s.x_gas = 0.5 * (port.inflow.x_gas + port.outflow.x_gas);

  s.pressure_ratio = std::exp(std::log(s.p) - domain.log_psat.eval(T));

  s.a_gas = clamp_activity(s.x_gas * s.p / c.p0);
  s.a_h2o = clamp_activity(s.x_h2o * s.pressure_ratio);
  return s;
}

} // namespace pemfc
