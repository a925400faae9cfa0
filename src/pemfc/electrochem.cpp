#include <pemfc/electrochem.hpp>

#include <pemfc/constants.hpp>

#include <cmath>

namespace pemfc {

double current_density(double branch_current, double cell_area) {
  if (branch_current <= 0.0) return -branch_current / cell_area;
  return 0.0;
}

double nernst_voltage(double E0, double T, double a_h2, double a_o2, double a_h2o) {
  return E0 + thermal_voltage(T) * std::log(a_h2 * std::sqrt(a_o2) / a_h2o);
}

double activation_loss(double i, double io, double alpha, double T) {
  if (i < io) return 0.0;
  const double b = kGasConstant * T / (2.0 * alpha * kFaraday);
  return b * std::log(i / io);
}

double concentration_loss(double i, double iL, double T) {
  const double b = thermal_voltage(T);
  const double i_anchor = kConcentrationLinearization * iL;
  if (i <= i_anchor) {
    return b * std::log(iL / (iL - i));
  }
  const double v_anchor = b * std::log(iL / (iL - i_anchor));
  const double slope = b / (iL - i_anchor);
  return v_anchor + slope * (i - i_anchor);
}

double ohmic_loss(double i, double resistance) {
  return resistance * i;
}

VoltageBreakdown compute_cell_voltage(const CellStackParameters& params,
                                      const DerivedConstants& c,
                                      double T,
                                      double i,
                                      double a_h2,
                                      double a_o2,
                                      double a_h2o,
                                      double resistance) {
  VoltageBreakdown v;
  v.nernst = nernst_voltage(c.E0, T, a_h2, a_o2, a_h2o);
  v.activation = activation_loss(i, params.exchange_current_density, params.charge_transfer_coefficient, T);
  v.ohmic = ohmic_loss(i, resistance);
  v.concentration = concentration_loss(i, params.limiting_current_density, T);
  v.cell = v.nernst - v.activation - v.ohmic - v.concentration;
  return v;
}

} // namespace pemfc
