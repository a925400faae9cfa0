#include <pemfc/gas_properties.hpp>
#include <pemfc/io.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace pemfc {

namespace {

// Saturation pressure of water (IAPWS-95), 0.01 C to 100 C.
PropertyTable water_log_psat(Extrapolation e) {
  const std::vector<double> T = {273.16, 283.15, 293.15, 303.15, 313.15, 323.15,
                                 333.15, 343.15, 353.15, 363.15, 373.15};
  const std::vector<double> psat = {611.657, 1228.1, 2339.3, 4246.9, 7384.9, 12352.0,
                                    19946.0, 31201.0, 47414.0, 70182.0, 101418.0};
  std::vector<double> lp;
  lp.reserve(psat.size());
  for (double p : psat) lp.push_back(std::log(p));
  return PropertyTable(T, lp, e);
}

// Ideal-gas water vapor, zero at liquid water 0 C.
PropertyTable water_vapor_enthalpy(Extrapolation e) {
  return PropertyTable({250.0, 273.15, 300.0, 350.0, 400.0},
                       {2457.6e3, 2500.9e3, 2551.1e3, 2644.6e3, 2738.1e3}, e);
}

PropertyTable water_latent_heat(Extrapolation e) {
  return PropertyTable({273.16, 298.15, 323.15, 348.15, 373.15},
                       {2500.9e3, 2441.7e3, 2382.0e3, 2321.4e3, 2256.4e3}, e);
}

PropertyTable water_vapor_viscosity(Extrapolation e) {
  return PropertyTable({250.0, 300.0, 350.0, 400.0},
                       {8.1e-6, 9.9e-6, 11.8e-6, 13.4e-6}, e);
}

GasDomain water_base(const std::string& name, Extrapolation e) {
  GasDomain d;
  d.name = name;
  d.R_water = 461.52;
  d.log_psat = water_log_psat(e);
  d.h_water = water_vapor_enthalpy(e);
  d.h_fg = water_latent_heat(e);
  d.mu_water = water_vapor_viscosity(e);
  return d;
}

} // namespace

double GasDomain::saturation_pressure(double T) const {
  return std::exp(log_psat.eval(T));
}

void GasDomain::set_extrapolation(Extrapolation e) {
  log_psat.extrapolation = e;
  h_water.extrapolation = e;
  h_gas.extrapolation = e;
  h_fg.extrapolation = e;
  mu_water.extrapolation = e;
}

GasDomain moist_hydrogen_domain(Extrapolation e) {
  GasDomain d = water_base("anode", e);
  d.trace_gas = "h2";
  d.R_gas = 4124.2;
  // cp ~ 14.3 kJ/(kg K), zero at 0 C
  d.h_gas = PropertyTable({250.0, 273.15, 300.0, 350.0, 400.0},
                          {-331.0e3, 0.0, 384.0e3, 1099.0e3, 1814.0e3}, e);
  return d;
}

GasDomain moist_air_domain(Extrapolation e) {
  GasDomain d = water_base("cathode", e);
  d.trace_gas = "o2";
  d.R_gas = 259.84;
  // cp ~ 0.918 kJ/(kg K), zero at 0 C
  d.h_gas = PropertyTable({250.0, 273.15, 300.0, 350.0, 400.0},
                          {-21.3e3, 0.0, 24.6e3, 70.5e3, 116.4e3}, e);
  return d;
}

GasDomain apply_overrides(GasDomain base, const DomainOverrides& o, Extrapolation e) {
  if (o.R_water) base.R_water = *o.R_water;
  if (o.R_gas) base.R_gas = *o.R_gas;

  for (const auto& [table, path] : o.table_files) {
    PropertyTable t = read_table_file(path);
    if (table == "log_psat") {
      base.log_psat = std::move(t);
    } else if (table == "h_water") {
      base.h_water = std::move(t);
    } else if (table == "h_gas") {
      base.h_gas = std::move(t);
    } else if (table == "h_fg") {
      base.h_fg = std::move(t);
    } else if (table == "mu_water") {
      base.mu_water = std::move(t);
    } else {
      throw std::runtime_error("Unknown property table '" + table + "' for domain " + base.name);
    }
  }

  base.set_extrapolation(e);
  if (!(base.R_water > 0.0) || !(base.R_gas > 0.0)) {
    throw std::runtime_error("Gas constants of domain " + base.name + " must be positive");
  }
  return base;
}

} // namespace pemfc
