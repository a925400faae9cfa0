#pragma once

#include <pemfc/profile.hpp>

#include <map>
#include <optional>
#include <string>

namespace pemfc {

// Property source of one moist-gas domain (water vapor + one trace gas).
// All tables are indexed by temperature [K].
struct GasDomain {
  std::string name;
  std::string trace_gas;     // "h2" or "o2"

  double R_water = 461.52;   // specific gas constant of water vapor [J/(kg K)]
  double R_gas = 0.0;        // specific gas constant of the trace gas [J/(kg K)]

  PropertyTable log_psat;    // ln(saturation pressure / Pa)
  PropertyTable h_water;     // water vapor specific enthalpy [J/kg]
  PropertyTable h_gas;       // trace gas specific enthalpy [J/kg]
  PropertyTable h_fg;        // latent heat of vaporization [J/kg]
  PropertyTable mu_water;    // water vapor dynamic viscosity [Pa s]

  double saturation_pressure(double T) const;
  void set_extrapolation(Extrapolation e);
};

// Built-in reference domains: anode (water vapor + hydrogen) and
// cathode (water vapor + oxygen as trace gas in air).
GasDomain moist_hydrogen_domain(Extrapolation e = Extrapolation::Linear);
GasDomain moist_air_domain(Extrapolation e = Extrapolation::Linear);

// User replacements for a built-in domain, read from [properties].
struct DomainOverrides {
  std::optional<double> R_water;
  std::optional<double> R_gas;
  // table name (log_psat | h_water | h_gas | h_fg | mu_water) -> two-column file
  std::map<std::string, std::string> table_files;
};

GasDomain apply_overrides(GasDomain base, const DomainOverrides& o, Extrapolation e);

} // namespace pemfc
