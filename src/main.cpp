#include <pemfc/config.hpp>
#include <pemfc/io.hpp>
#include <pemfc/operating_point.hpp>
#include <pemfc/stack.hpp>
#include <pemfc/verify.hpp>

#include <iostream>
#include <filesystem>
#include <stdexcept>
#include <string>

#ifdef PEMFC_HAS_OPENMP
#include <omp.h>
#endif

namespace {

void print_usage() {
  std::cout << "pemfc (PEM fuel-cell stack steady-state model)\n"
            << "Usage:\n"
            << "  pemfc --config <path/to/stack.ini>\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    std::string cfg_path;
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config" && i + 1 < argc) {
        cfg_path = argv[++i];
      } else if (a == "-h" || a == "--help") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage();
        return 2;
      }
    }
    if (cfg_path.empty()) {
      print_usage();
      return 2;
    }

    pemfc::StackConfig cfg = pemfc::load_config(cfg_path);

#ifdef PEMFC_HAS_OPENMP
    if (cfg.omp_threads > 0) {
      omp_set_num_threads(cfg.omp_threads);
    }
#endif

    // Create output root, copy config
    pemfc::ensure_dir(cfg.output_dir);
    pemfc::copy_file(cfg_path, (std::filesystem::path(cfg.output_dir) / "config_used.ini").string());

    pemfc::FuelCellStack stack = pemfc::build_stack(cfg);
    const pemfc::DerivedConstants& c = stack.constants();
    std::cout << "[constants] E0=" << c.E0 << " V, LHV=" << c.lhv << " J/mol, M_H2O=" << c.M_h2o
              << " kg/mol\n";

    pemfc::OperatingPoint op = pemfc::solve_operating_point(stack, cfg.inputs, cfg.solver);
    pemfc::write_operating_point_outputs(cfg, op, "operating_point");

    std::cout << "[operating] i=" << op.current_density << " A/m^2"
              << " V_stack=" << op.evaluation.outputs.voltage << " V"
              << " Q=" << op.evaluation.outputs.heat_flow << " W"
              << " a_acl=" << op.unknowns.activities.a_acl
              << " a_ccl=" << op.unknowns.activities.a_ccl
              << " (iterations=" << op.iterations
              << ", converged=" << (op.converged ? "true" : "false") << ")\n";

    if (cfg.verify) {
      auto rep = pemfc::verify_operating_point(stack, cfg.inputs, op, cfg.solver.tol);
      std::cout << "[verify] flux residual: " << rep.flux_residual
                << " (ok=" << (rep.flux_ok ? "true" : "false") << ")\n";
      std::cout << "[verify] voltage law residual: " << rep.voltage_residual
                << ", terminal power mismatch: " << rep.power_residual
                << " (ok=" << (rep.voltage_ok ? "true" : "false") << ")\n";
      std::cout << "[verify] source enthalpy closure: " << rep.energy_closure
                << ", heat flow mismatch: " << rep.heat_residual
                << " (ok=" << (rep.energy_ok ? "true" : "false") << ")\n";
      std::cout << "[verify] deterministic: " << (rep.deterministic ? "true" : "false") << "\n";
    }

    bool all_converged = op.converged;

    if (cfg.sweep.enabled) {
      auto currents = pemfc::linspace(cfg.sweep.i_min, cfg.sweep.i_max, cfg.sweep.n_points);
      auto curve = pemfc::polarization_curve(stack, cfg.inputs, currents, cfg.solver);
      pemfc::write_polarization_outputs(cfg, curve, "polarization");

      std::size_t failed = 0;
      for (const auto& p : curve) {
        if (!p.converged) ++failed;
      }
      std::cout << "[sweep] " << curve.size() << " points, " << failed << " not converged\n";
      if (failed > 0) all_converged = false;
    }

    if (!all_converged) {
      std::cerr << "Solver did not converge; results written for inspection.\n";
      return 3;
    }

    std::cout << "Done. Output in: " << cfg.output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
