#pragma once

#include <pemfc/stack_constants.hpp>
#include <pemfc/state.hpp>
#include <pemfc/types.hpp>

namespace pemfc {

// Membrane water content lambda [mol H2O / mol SO3-] from water activity.
// Cubic fit on [0,1], linear continuation below 0 and above 1.
double membrane_water(double a);

// Proton conductivity [S/m] at temperature T from the mean water content.
double membrane_conductivity(double lambda_avg, double T);

// Water diffusivity in the membrane [m^2/s], Arrhenius-corrected from 30 C.
double membrane_diffusivity(double D30, double T);

// Electro-osmotic drag coefficient [H2O/H+] from the anode-side water content.
double drag_coefficient(double lambda_anode);

// Darcy flux of water vapor anode->cathode [mol/(m^2 s)]. The upstream side
// supplies mole fraction and molar density.
double hydraulic_flux(double p_anode, double p_cathode,
                      double x_h2o_anode, double x_h2o_cathode,
                      double T, double permeability, double viscosity, double thickness);

// Fickian vapor flux across a GDL from activity a_from to a_to [mol/(m^2 s)].
double gdl_vapor_flux(double diffusivity, double thickness, double p_sat, double T,
                      double a_from, double a_to);

struct MembraneTransport {
  double lambda_anode = 0.0;
  double lambda_cathode = 0.0;
  double lambda_avg = 0.0;
  double conductivity = 0.0;     // [S/m]
  double resistance = 0.0;       // area-specific [Ohm m^2]
  double diffusivity = 0.0;      // [m^2/s]
  double drag = 0.0;             // drag coefficient [-]

  // anode->cathode molar fluxes [mol/(m^2 s)]
  double j_diffusion = 0.0;
  double j_drag = 0.0;
  double j_hydraulic = 0.0;
  double j_total = 0.0;
};

MembraneTransport compute_membrane_transport(const CellStackParameters& params,
                                             const DerivedConstants& c,
                                             double T,
                                             double i,
                                             const UnknownActivities& x,
                                             const ChannelState& anode,
                                             const ChannelState& cathode,
                                             double viscosity);

} // namespace pemfc
