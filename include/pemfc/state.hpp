#pragma once

#include <pemfc/gas_properties.hpp>
#include <pemfc/stack_constants.hpp>
#include <pemfc/types.hpp>

namespace pemfc {

// Averaged conditions of one electrode channel.
struct ChannelState {
  double p = 0.0;               // mean of inflow/outflow pressure [Pa]
  double x_h2o = 0.0;           // mean water vapor mole fraction
  double x_gas = 0.0;           // mean reactant mole fraction
  double pressure_ratio = 0.0;  // p / p_sat(T)
  double a_gas = 0.0;           // reactant activity x p / p0 (floored)
  double a_h2o = 0.0;           // water activity x p / p_sat (floored)
};

// Activities below 1e-9 become exactly 1e-6; others pass through unchanged.
double clamp_activity(double a);

ChannelState extract_channel_state(const PortSamples& port,
                                   const GasDomain& domain,
                                   double T,
                                   const DerivedConstants& c);

} // namespace pemfc
