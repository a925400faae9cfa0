#pragma once

namespace pemfc {

// Fundamental constants (CODATA 2018).
constexpr double kGasConstant = 8.31446261815324;  // J/(mol K)
constexpr double kFaraday     = 96485.33212;       // C/mol

// Standard state.
constexpr double kStandardTemperature = 298.15;    // K
constexpr double kStandardPressure    = 101325.0;  // Pa

// Water formation H2 + 1/2 O2 -> H2O at the standard state.
constexpr double kGibbsWaterFormation = -237.13e3; // J/mol (liquid product)
constexpr double kHigherHeatingValue  = 285.83e3;  // J/mol H2

// Nafion-type membrane hydraulic permeability.
constexpr double kMembranePermeability = 1.8e-18;  // m^2

// Reference temperature of the Springer membrane correlations (30 C).
constexpr double kMembraneReferenceTemperature = 303.15; // K

// Activities below kActivityThreshold are replaced by kActivityFloor.
constexpr double kActivityThreshold = 1e-9;
constexpr double kActivityFloor     = 1e-6;

// Lower bound of the 30 C membrane conductivity in the dry regime.
constexpr double kMinimumConductivity30 = 1e-5;  // S/cm

// Concentration loss is linearized above this fraction of the limiting current.
constexpr double kConcentrationLinearization = 0.999;

inline double thermal_voltage(double T) { return kGasConstant * T / (2.0 * kFaraday); }

} // namespace pemfc
