#pragma once

#include <pemfc/gas_properties.hpp>
#include <pemfc/types.hpp>

namespace pemfc {

// Constants derived once per parameter set. Molar quantities use the
// product-side (cathode) water tables and each electrode's own trace gas.
struct DerivedConstants {
  double R = 0.0;                // [J/(mol K)]
  double F = 0.0;                // [C/mol]
  double T0 = 0.0;               // [K]
  double p0 = 0.0;               // [Pa]

  double gibbs_formation = 0.0;  // [J/mol], negative
  double hhv = 0.0;              // [J/mol H2]
  double lhv = 0.0;              // [J/mol H2], HHV minus latent heat at T0
  double E0 = 0.0;               // standard cell potential [V]

  double permeability = 0.0;     // membrane Darcy permeability [m^2]
  double fixed_charge = 0.0;     // dry density / equivalent weight [mol/m^3]

  double M_h2o = 0.0;            // [kg/mol]
  double M_h2 = 0.0;
  double M_o2 = 0.0;

  double h0_h2o = 0.0;           // standard molar enthalpies at T0 [J/mol]
  double h0_h2 = 0.0;
  double h0_o2 = 0.0;
};

DerivedConstants derive_constants(const CellStackParameters& params,
                                  const GasDomain& anode,
                                  const GasDomain& cathode);

} // namespace pemfc
