#include <gtest/gtest.h>

#include <pemfc/config.hpp>
#include <pemfc/stack.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace pemfc;

namespace {

const std::string kDataDir = PEMFC_TEST_DATA_DIR;

std::string write_temp_ini(const std::string& name, const std::string& body) {
  const std::filesystem::path p = std::filesystem::temp_directory_path() / name;
  std::ofstream f(p);
  f << body;
  return p.string();
}

} // namespace

TEST(ConfigTest, LoadsTestStack) {
  StackConfig cfg = load_config(kDataDir + "/stack.ini");

  EXPECT_EQ(cfg.output_dir, "out_test");
  EXPECT_TRUE(cfg.verify);
  EXPECT_EQ(cfg.params.n_cells, 100.0);
  EXPECT_EQ(cfg.params.cell_area, 0.02);
  EXPECT_EQ(cfg.params.membrane_thickness, 50e-6);
  EXPECT_EQ(cfg.params.gdl_thickness, 200e-6);
  EXPECT_EQ(cfg.params.exchange_current_density, 20.0);
  EXPECT_EQ(cfg.params.limiting_current_density, 15000.0);
  EXPECT_EQ(cfg.params.charge_transfer_coefficient, 0.45);
  EXPECT_EQ(cfg.params.gdl_vapor_diffusivity, 8e-6);

  // untouched sections keep defaults
  EXPECT_EQ(cfg.params.dry_density, 2000.0);
  EXPECT_EQ(cfg.params.permeability, 1.8e-18);
}

TEST(ConfigTest, OperatingPointAndCurrentSign) {
  StackConfig cfg = load_config(kDataDir + "/stack.ini");

  EXPECT_EQ(cfg.current_density, 4000.0);
  EXPECT_DOUBLE_EQ(cfg.inputs.current, -4000.0 * 0.02);
  EXPECT_EQ(cfg.inputs.T_stack, 343.15);
  EXPECT_EQ(cfg.inputs.cathode.inflow.x_h2o, 0.10);
  EXPECT_EQ(cfg.inputs.cathode.inflow.x_gas, 0.19);

  // ports not named in the file fall back to the reference conditions
  const StackInputs ref = reference_inputs();
  EXPECT_EQ(cfg.inputs.anode.inflow.p, ref.anode.inflow.p);
  EXPECT_EQ(cfg.inputs.cathode.outflow.x_h2o, ref.cathode.outflow.x_h2o);
}

TEST(ConfigTest, SolverAndSweep) {
  StackConfig cfg = load_config(kDataDir + "/stack.ini");

  EXPECT_EQ(cfg.solver.max_iter, 40);
  EXPECT_EQ(cfg.solver.tol, 1e-10);
  EXPECT_EQ(cfg.solver.fd_step, 1e-7);
  EXPECT_TRUE(cfg.sweep.enabled);
  EXPECT_EQ(cfg.sweep.i_min, 0.0);
  EXPECT_EQ(cfg.sweep.i_max, 10000.0);
  EXPECT_EQ(cfg.sweep.n_points, 11u);
}

TEST(ConfigTest, PropertyOverridesResolveAgainstIniDirectory) {
  StackConfig cfg = load_config(kDataDir + "/stack.ini");

  EXPECT_EQ(cfg.extrapolation, Extrapolation::Nearest);
  EXPECT_TRUE(cfg.anode_props.table_files.empty());
  ASSERT_EQ(cfg.cathode_props.table_files.count("h_water"), 1u);
  EXPECT_EQ(std::filesystem::path(cfg.cathode_props.table_files.at("h_water")),
            std::filesystem::path(kDataDir) / "h_water_coarse.dat");

  FuelCellStack stack = build_stack(cfg);
  const GasDomain& cathode = stack.cathode_domain();
  EXPECT_EQ(cathode.h_water.size(), 2u);
  EXPECT_NEAR(cathode.h_water.eval(323.15), 2594.4e3, 1e-6);
  EXPECT_EQ(cathode.h_water.eval(400.0), 2687.9e3);
  EXPECT_EQ(stack.anode_domain().h_water.eval(250.0), 2457.6e3);
}

TEST(ConfigTest, ReferenceInputs) {
  const StackInputs in = reference_inputs();
  EXPECT_EQ(in.T_stack, 353.15);
  EXPECT_EQ(in.current, 0.0);
  EXPECT_EQ(in.anode.inflow.p, 1.5e5);
  EXPECT_EQ(in.anode.outflow.p, 1.45e5);
  EXPECT_EQ(in.anode.inflow.x_gas, 0.8);
  EXPECT_EQ(in.cathode.inflow.x_gas, 0.18);
  EXPECT_EQ(in.cathode.outflow.x_h2o, 0.30);
}

TEST(ConfigTest, MissingFileThrows) {
  EXPECT_THROW(load_config(kDataDir + "/does_not_exist.ini"), std::runtime_error);
}

TEST(ConfigTest, MalformedLineThrows) {
  const std::string path = write_temp_ini("pemfc_malformed.ini", "[stack]\nn_cells 100\n");
  EXPECT_THROW(parse_ini_file(path), std::runtime_error);
}

TEST(ConfigTest, InvalidNumberThrows) {
  const std::string path = write_temp_ini("pemfc_badnumber.ini", "[stack]\nn_cells = many\n");
  EXPECT_THROW(load_config(path), std::runtime_error);
}

TEST(ConfigTest, InvalidParametersReportConfigurationError) {
  const std::string path = write_temp_ini("pemfc_badparams.ini",
                                          "[stack]\ncell_area = 0\n"
                                          "[kinetics]\nexchange_current_density = 500\n"
                                          "limiting_current_density = 400\n");
  try {
    load_config(path);
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError& e) {
    EXPECT_EQ(e.violations().size(), 2u);
  }
}

TEST(ConfigTest, InvalidPortThrows) {
  const std::string path = write_temp_ini("pemfc_badport.ini",
                                          "[operating]\nanode_in.x_h2o = 0.6\nanode_in.x_gas = 0.6\n");
  EXPECT_THROW(load_config(path), std::runtime_error);
}

TEST(ConfigTest, CommentsAndDefaultSection) {
  const std::string path = write_temp_ini("pemfc_comments.ini",
                                          "output_dir = elsewhere ; inline\n"
                                          "# full-line comment\n"
                                          "[sweep]\nenabled = off\n");
  StackConfig cfg = load_config(path);
  EXPECT_EQ(cfg.output_dir, "elsewhere");
  EXPECT_FALSE(cfg.sweep.enabled);
  EXPECT_EQ(cfg.params.n_cells, 210.0);
}
