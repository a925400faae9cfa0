#pragma once

#include <pemfc/constants.hpp>

#include <array>
#include <cstddef>

namespace pemfc {

struct CellStackParameters {
  // Geometry
  double n_cells = 210.0;                 // [-]
  double cell_area = 280e-4;              // [m^2]
  double membrane_thickness = 125e-6;     // [m]
  double gdl_thickness = 250e-6;          // [m]

  // Kinetics
  double exchange_current_density = 17.0;     // io [A/m^2]
  double limiting_current_density = 14000.0;  // iL [A/m^2]
  double charge_transfer_coefficient = 0.5;   // alpha [-]

  // Transport
  double gdl_vapor_diffusivity = 0.07e-4;       // [m^2/s]
  double membrane_water_diffusivity = 1.25e-10; // at 30 C [m^2/s]

  // Membrane material
  double dry_density = 2000.0;     // [kg/m^3]
  double equivalent_weight = 1.1;  // [kg/mol]
  double permeability = kMembranePermeability;  // Darcy permeability [m^2]
};

// 8-element flow-state sample as delivered by the host flow network:
//   [p, T, RH_w, w_w, x_w, w_g, RH_g, x_g]
// Only pressure and the two mole fractions are consumed.
using FlowStateVector = std::array<double, 8>;

namespace flow_index {
constexpr std::size_t pressure = 0;        // [Pa]
constexpr std::size_t temperature = 1;     // [K]
constexpr std::size_t water_mole_fraction = 4;
constexpr std::size_t gas_mole_fraction = 7;
} // namespace flow_index

struct GasState {
  double p = 101325.0;   // [Pa]
  double T = 298.15;     // [K] (carried, not used by the extraction)
  double x_h2o = 0.0;    // water vapor mole fraction
  double x_gas = 0.0;    // trace gas (H2 or O2) mole fraction

  static GasState from_flow_vector(const FlowStateVector& v);
};

// Inflow/outflow pair of one electrode channel.
struct PortSamples {
  GasState inflow;
  GasState outflow;
};

// Catalyst-layer water activities solved by the host solver.
struct UnknownActivities {
  double a_acl = 0.5;  // anode catalyst layer
  double a_ccl = 0.5;  // cathode catalyst layer
};

// Everything the host network supplies to one residual evaluation.
struct StackInputs {
  double current = 0.0;      // branch current p->n [A]; negative when discharging
  double T_stack = 353.15;   // thermal port temperature [K]
  PortSamples anode;
  PortSamples cathode;
};

struct SolverOptions {
  int max_iter = 50;
  double tol = 1e-9;         // on the flux residuals [mol/(m^2 s)]
  double fd_step = 1e-7;     // finite-difference step on activities
  double damping = 1.0;      // Newton step scaling in (0,1]
  UnknownActivities initial;
};

} // namespace pemfc
