#include <pemfc/membrane.hpp>

#include <pemfc/constants.hpp>

#include <algorithm>
#include <cmath>

namespace pemfc {

double membrane_water(double a) {
  if (a < 0.0) {
    return 0.043 + 17.81 * a;
  } else if (a <= 1.0) {
    return 0.043 + 17.81 * a - 39.85 * a * a + 36.0 * a * a * a;
  }
  // 0.043 + 17.81 - 39.85 + 36 at a = 1
  return 14.003 + 1.4 * (a - 1.0);
}

double membrane_conductivity(double lambda_avg, double T) {
  double sigma30 = 0.0; // [S/cm]
  if (lambda_avg >= 1.0) {
    sigma30 = 0.005139 * lambda_avg - 0.00326;
  } else {
    sigma30 = std::max((0.005139 - 0.00326) * lambda_avg, kMinimumConductivity30);
  }
  return 100.0 * sigma30 * std::exp(1268.0 * (1.0 / kMembraneReferenceTemperature - 1.0 / T));
}

double membrane_diffusivity(double D30, double T) {
  return D30 * std::exp(2416.0 * (1.0 / kMembraneReferenceTemperature - 1.0 / T));
}

double drag_coefficient(double lambda_anode) {
  if (lambda_anode >= 0.0) {
    return 0.0029 * lambda_anode * lambda_anode + 0.05 * lambda_anode;
  }
  return 0.05 * lambda_anode;
}

double hydraulic_flux(double p_anode, double p_cathode,
                      double x_h2o_anode, double x_h2o_cathode,
                      double T, double permeability, double viscosity, double thickness) {
  const double velocity = permeability / viscosity * (p_anode - p_cathode) / thickness;
  if (p_anode >= p_cathode) {
    return x_h2o_anode * p_anode / (kGasConstant * T) * velocity;
  }
  return x_h2o_cathode * p_cathode / (kGasConstant * T) * velocity;
}

double gdl_vapor_flux(double diffusivity, double thickness, double p_sat, double T,
                      double a_from, double a_to) {
  return diffusivity / thickness * p_sat / (kGasConstant * T) * (a_from - a_to);
}

MembraneTransport compute_membrane_transport(const CellStackParameters& params,
                                             const DerivedConstants& c,
                                             double T,
                                             double i,
                                             const UnknownActivities& x,
                                             const ChannelState& anode,
                                             const ChannelState& cathode,
                                             double viscosity) {
  MembraneTransport m;
  m.lambda_anode = membrane_water(x.a_acl);
  m.lambda_cathode = membrane_water(x.a_ccl);
  m.lambda_avg = 0.5 * (m.lambda_anode + m.lambda_cathode);

  m.conductivity = membrane_conductivity(m.lambda_avg, T);
  m.resistance = params.membrane_thickness / m.conductivity;
  m.diffusivity = membrane_diffusivity(params.membrane_water_diffusivity, T);
  m.drag = drag_coefficient(m.lambda_anode);

  m.j_diffusion = c.fixed_charge * m.diffusivity * (m.lambda_anode - m.lambda_cathode) / params.membrane_thickness;
  m.j_drag = m.drag * i / c.F;
  m.j_hydraulic = hydraulic_flux(anode.p, cathode.p, anode.x_h2o, cathode.x_h2o, T,
                                 c.permeability, viscosity, params.membrane_thickness);
  m.j_total = m.j_diffusion + m.j_drag + m.j_hydraulic;
  return m;
}

} // namespace pemfc
