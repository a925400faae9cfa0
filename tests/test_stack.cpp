#include <gtest/gtest.h>

#include <pemfc/config.hpp>
#include <pemfc/stack.hpp>

#include <cmath>
#include <cstring>

using namespace pemfc;

namespace {

FuelCellStack reference_stack() {
  return FuelCellStack(CellStackParameters{}, moist_hydrogen_domain(), moist_air_domain());
}

StackInputs discharging(double i) {
  StackInputs in = reference_inputs();
  in.current = -i * CellStackParameters{}.cell_area;
  return in;
}

} // namespace

TEST(FuelCellStackTest, RejectsInvalidParameters) {
  CellStackParameters p;
  p.n_cells = -3.0;
  EXPECT_THROW(FuelCellStack(p, moist_hydrogen_domain(), moist_air_domain()), ConfigurationError);
}

TEST(FuelCellStackTest, EvaluationIsBitIdentical) {
  const FuelCellStack stack = reference_stack();
  const StackInputs in = discharging(5000.0);
  StackUnknowns u;
  u.voltage = 190.0;
  u.heat_flow = 12000.0;
  u.activities = {0.68, 0.77};

  const ResidualVector a = stack.residual(in, u);
  const ResidualVector b = stack.residual(in, u);
  EXPECT_EQ(std::memcmp(a.data(), b.data(), sizeof(double) * a.size()), 0);
}

TEST(FuelCellStackTest, VoltageAndHeatResidualsVanishAtEvaluatedValues) {
  const FuelCellStack stack = reference_stack();
  const StackInputs in = discharging(5000.0);
  const UnknownActivities x{0.68, 0.77};
  const StackEvaluation ev = stack.evaluate(in, x);

  StackUnknowns u;
  u.activities = x;
  u.voltage = ev.outputs.voltage;
  u.heat_flow = -ev.energy.p_dissipated;

  const ResidualVector r = FuelCellStack::residual_of(ev, u);
  EXPECT_EQ(r[0], 0.0);
  EXPECT_EQ(r[1], 0.0);
  EXPECT_DOUBLE_EQ(ev.outputs.voltage, stack.params().n_cells * ev.voltage.cell);

  u.voltage += 1.5;
  EXPECT_DOUBLE_EQ(FuelCellStack::residual_of(ev, u)[0], 1.5);
}

TEST(FuelCellStackTest, FluxResidualsBalanceGdlAgainstMembrane) {
  const FuelCellStack stack = reference_stack();
  const StackEvaluation ev = stack.evaluate(discharging(5000.0), UnknownActivities{0.6, 0.9});

  StackUnknowns u;
  u.activities = {0.6, 0.9};
  const ResidualVector r = FuelCellStack::residual_of(ev, u);
  EXPECT_EQ(r[2], ev.j_gdl_anode - ev.membrane.j_total);
  EXPECT_EQ(r[3], ev.j_gdl_cathode - (ev.membrane.j_total + ev.j_production));
  EXPECT_DOUBLE_EQ(ev.j_production, 5000.0 / (2.0 * stack.constants().F));
}

TEST(FuelCellStackTest, OpenCircuitChannelActivitiesAreExactSolution) {
  const FuelCellStack stack = reference_stack();
  const StackInputs in = reference_inputs();
  const StackEvaluation probe = stack.evaluate(in, UnknownActivities{});

  // Both channels see the same mean pressure and humidity.
  const UnknownActivities x{probe.anode.a_h2o, probe.cathode.a_h2o};
  const StackEvaluation ev = stack.evaluate(in, x);
  StackUnknowns u;
  u.activities = x;
  const ResidualVector r = FuelCellStack::residual_of(ev, u);
  EXPECT_EQ(r[2], 0.0);
  EXPECT_EQ(r[3], 0.0);
  EXPECT_EQ(ev.voltage.cell, ev.voltage.nernst);
}

TEST(FuelCellStackTest, ChargingCurrentIsTreatedAsOpenCircuit) {
  const FuelCellStack stack = reference_stack();
  StackInputs in = reference_inputs();
  in.current = 5.0;
  const StackEvaluation ev = stack.evaluate(in, UnknownActivities{0.7, 0.7});

  EXPECT_EQ(ev.i, 0.0);
  EXPECT_EQ(ev.outputs.current, 5.0);
  EXPECT_EQ(ev.outputs.h2_consumption, 0.0);
  EXPECT_EQ(ev.outputs.anode_reaction.gas_mass_flow, 0.0);
  EXPECT_EQ(ev.outputs.cathode_reaction.water_mass_flow, 0.0);
  EXPECT_EQ(ev.voltage.cell, ev.voltage.nernst);
}

TEST(FuelCellStackTest, MassSourcesFollowStoichiometry) {
  const FuelCellStack stack = reference_stack();
  const DerivedConstants& c = stack.constants();
  const StackEvaluation ev = stack.evaluate(discharging(5000.0), UnknownActivities{0.68, 0.77});
  const StackOutputs& o = ev.outputs;

  const double rate = stack.params().n_cells * stack.params().cell_area * 5000.0 / (2.0 * c.F);
  EXPECT_DOUBLE_EQ(o.h2_consumption, rate);
  EXPECT_DOUBLE_EQ(o.o2_consumption, 0.5 * rate);
  EXPECT_DOUBLE_EQ(o.h2o_production, rate);

  EXPECT_LT(o.anode_reaction.gas_mass_flow, 0.0);
  EXPECT_EQ(o.anode_reaction.water_mass_flow, 0.0);
  EXPECT_LT(o.cathode_reaction.gas_mass_flow, 0.0);
  EXPECT_GT(o.cathode_reaction.water_mass_flow, 0.0);
  EXPECT_DOUBLE_EQ(o.cathode_reaction.water_mass_flow, rate * c.M_h2o);
  EXPECT_DOUBLE_EQ(o.anode_reaction.gas_mass_flow, -rate * c.M_h2);
  EXPECT_DOUBLE_EQ(o.cathode_reaction.gas_mass_flow, -0.5 * rate * c.M_o2);

  // Moisture leaves the anode and reaches the cathode unchanged in mass.
  EXPECT_DOUBLE_EQ(o.anode_moisture.water_mass_flow, -o.cathode_moisture.water_mass_flow);
  EXPECT_EQ(o.anode_moisture.gas_mass_flow, 0.0);

  EXPECT_EQ(o.anode_reaction.temperature, 353.15);
  EXPECT_EQ(o.cathode_moisture.temperature, 353.15);
}

TEST(FuelCellStackTest, HydraulicFluxFollowsPressureDifference) {
  const FuelCellStack stack = reference_stack();
  StackInputs in = discharging(5000.0);
  const UnknownActivities x{0.68, 0.77};

  // Reference channels share their mean pressure.
  EXPECT_EQ(stack.evaluate(in, x).membrane.j_hydraulic, 0.0);

  in.anode.inflow.p += 2e4;
  in.anode.outflow.p += 2e4;
  EXPECT_GT(stack.evaluate(in, x).membrane.j_hydraulic, 0.0);

  in = discharging(5000.0);
  in.cathode.inflow.p += 2e4;
  in.cathode.outflow.p += 2e4;
  EXPECT_LT(stack.evaluate(in, x).membrane.j_hydraulic, 0.0);
}

TEST(FuelCellStackTest, SupersaturatedActivitiesStayFinite) {
  const FuelCellStack stack = reference_stack();
  const StackEvaluation ev = stack.evaluate(discharging(5000.0), UnknownActivities{1.3, 1.6});
  EXPECT_TRUE(std::isfinite(ev.voltage.cell));
  EXPECT_TRUE(std::isfinite(ev.membrane.j_total));
  EXPECT_GT(ev.membrane.lambda_cathode, 14.003);
}

TEST(FuelCellStackTest, ZeroWaterContentAtOpenCircuitStaysFinite) {
  const FuelCellStack stack = reference_stack();
  // membrane water content vanishes here
  const double a0 = -0.043 / 17.81;
  const StackEvaluation ev = stack.evaluate(reference_inputs(), UnknownActivities{a0, a0});

  EXPECT_GT(ev.membrane.conductivity, 0.0);
  EXPECT_TRUE(std::isfinite(ev.membrane.resistance));
  EXPECT_EQ(ev.voltage.ohmic, 0.0);
  EXPECT_TRUE(std::isfinite(ev.voltage.cell));
  EXPECT_TRUE(std::isfinite(ev.outputs.heat_flow));

  StackUnknowns u;
  u.activities = {a0, a0};
  for (double r : FuelCellStack::residual_of(ev, u)) EXPECT_TRUE(std::isfinite(r));
}

TEST(FuelCellStackTest, NegativeActivitiesNeverRaiseVoltage) {
  const FuelCellStack stack = reference_stack();
  const StackEvaluation ev = stack.evaluate(discharging(5000.0), UnknownActivities{-0.01, -0.01});

  EXPECT_GT(ev.membrane.resistance, 0.0);
  EXPECT_TRUE(std::isfinite(ev.voltage.ohmic));
  EXPECT_GE(ev.voltage.ohmic, 0.0);
  EXPECT_LT(ev.voltage.cell, ev.voltage.nernst);
  EXPECT_TRUE(std::isfinite(ev.outputs.heat_flow));
}

TEST(FuelCellStackTest, FlowVectorFeedsChannelState) {
  FlowStateVector v{};
  v[flow_index::pressure] = 1.5e5;
  v[flow_index::temperature] = 353.15;
  v[flow_index::water_mole_fraction] = 0.2;
  v[flow_index::gas_mole_fraction] = 0.8;

  StackInputs in = reference_inputs();
  in.anode.inflow = GasState::from_flow_vector(v);
  in.anode.outflow = GasState::from_flow_vector(v);

  const FuelCellStack stack = reference_stack();
  const StackEvaluation ev = stack.evaluate(in, UnknownActivities{});
  EXPECT_EQ(ev.anode.p, 1.5e5);
  EXPECT_EQ(ev.anode.x_gas, 0.8);
}
