#include <gtest/gtest.h>

#include <pemfc/constants.hpp>
#include <pemfc/electrochem.hpp>
#include <pemfc/gas_properties.hpp>

#include <cmath>

using namespace pemfc;

TEST(CurrentDensityTest, DischargeOnly) {
  EXPECT_DOUBLE_EQ(current_density(-14.0, 280e-4), 500.0);
  EXPECT_EQ(current_density(0.0, 280e-4), 0.0);
  EXPECT_EQ(current_density(3.0, 280e-4), 0.0);
}

TEST(NernstTest, UnitActivitiesGiveStandardPotential) {
  EXPECT_DOUBLE_EQ(nernst_voltage(1.229, 353.15, 1.0, 1.0, 1.0), 1.229);
}

TEST(NernstTest, DrierCathodeRaisesVoltage) {
  const double wet = nernst_voltage(1.229, 353.15, 1.0, 0.2, 1.0);
  const double dry = nernst_voltage(1.229, 353.15, 1.0, 0.2, 0.1);
  EXPECT_NEAR(dry - wet, thermal_voltage(353.15) * std::log(10.0), 1e-12);
}

TEST(ActivationLossTest, ZeroBelowAndAtExchangeCurrent) {
  EXPECT_EQ(activation_loss(0.0, 17.0, 0.5, 353.15), 0.0);
  EXPECT_EQ(activation_loss(16.999, 17.0, 0.5, 353.15), 0.0);
  EXPECT_EQ(activation_loss(17.0, 17.0, 0.5, 353.15), 0.0);
}

TEST(ActivationLossTest, TafelAboveExchangeCurrent) {
  const double T = 353.15;
  const double b = kGasConstant * T / (2.0 * 0.5 * kFaraday);
  EXPECT_NEAR(activation_loss(5000.0, 17.0, 0.5, T), b * std::log(5000.0 / 17.0), 1e-12);
  EXPECT_GT(activation_loss(17.0 * 1.0001, 17.0, 0.5, T), 0.0);
}

TEST(ConcentrationLossTest, ZeroWithoutCurrent) {
  EXPECT_EQ(concentration_loss(0.0, 14000.0, 353.15), 0.0);
}

TEST(ConcentrationLossTest, ContinuousAtLinearizationAnchor) {
  const double iL = 14000.0;
  const double anchor = 0.999 * iL;
  const double at = concentration_loss(anchor, iL, 353.15);
  EXPECT_NEAR(concentration_loss(anchor * (1.0 + 1e-12), iL, 353.15), at, 1e-8);
  EXPECT_NEAR(concentration_loss(anchor * (1.0 - 1e-12), iL, 353.15), at, 1e-8);
  EXPECT_NEAR(at, thermal_voltage(353.15) * std::log(1000.0), 1e-9);
}

TEST(ConcentrationLossTest, LinearWithAnchorSlopeBeyond) {
  const double iL = 14000.0, T = 353.15;
  const double anchor = 0.999 * iL;
  const double slope = thermal_voltage(T) / (iL - anchor);

  const double v1 = concentration_loss(iL, iL, T);
  const double v2 = concentration_loss(1.2 * iL, iL, T);
  EXPECT_TRUE(std::isfinite(v1));
  EXPECT_NEAR(v1 - concentration_loss(anchor, iL, T), slope * (iL - anchor), 1e-9);
  EXPECT_NEAR((v2 - v1) / (0.2 * iL), slope, 1e-6 * slope);
}

TEST(OhmicLossTest, ProportionalToCurrent) {
  EXPECT_EQ(ohmic_loss(0.0, 2e-5), 0.0);
  EXPECT_DOUBLE_EQ(ohmic_loss(5000.0, 2e-5), 0.1);
}

TEST(CellVoltageTest, OpenCircuitEqualsNernst) {
  CellStackParameters p;
  DerivedConstants c = derive_constants(p, moist_hydrogen_domain(), moist_air_domain());

  VoltageBreakdown v = compute_cell_voltage(p, c, 353.15, 0.0, 1.1, 0.21, 0.7, 2e-5);
  EXPECT_EQ(v.activation, 0.0);
  EXPECT_EQ(v.ohmic, 0.0);
  EXPECT_EQ(v.concentration, 0.0);
  EXPECT_EQ(v.cell, v.nernst);
}

TEST(CellVoltageTest, LossesAreSubtracted) {
  CellStackParameters p;
  DerivedConstants c = derive_constants(p, moist_hydrogen_domain(), moist_air_domain());

  VoltageBreakdown v = compute_cell_voltage(p, c, 353.15, 5000.0, 1.1, 0.21, 0.7, 2e-5);
  EXPECT_GT(v.activation, 0.0);
  EXPECT_GT(v.ohmic, 0.0);
  EXPECT_GT(v.concentration, 0.0);
  EXPECT_DOUBLE_EQ(v.cell, v.nernst - v.activation - v.ohmic - v.concentration);
  EXPECT_LT(v.cell, v.nernst);
}
