#include <pemfc/operating_point.hpp>

#include <pemfc/io.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace pemfc {

namespace fs = std::filesystem;

namespace {

using Flux2 = std::array<double, 2>;

Flux2 flux_residual(const FuelCellStack& stack, const StackInputs& in, const UnknownActivities& x) {
  StackUnknowns u;
  u.activities = x;
  ResidualVector r = FuelCellStack::residual_of(stack.evaluate(in, x), u);
  return {r[2], r[3]};
}

double max_abs(const Flux2& r) {
  return std::max(std::fabs(r[0]), std::fabs(r[1]));
}

// Keep a single Newton update within this many activity units.
constexpr double kMaxStep = 0.5;

} // namespace

OperatingPoint solve_operating_point(const FuelCellStack& stack,
                                     const StackInputs& in,
                                     const SolverOptions& opt) {
  OperatingPoint op;
  op.current_density = current_density(in.current, stack.params().cell_area);

  UnknownActivities x = opt.initial;
  Flux2 r = flux_residual(stack, in, x);

  for (int it = 0; it < opt.max_iter; ++it) {
    if (max_abs(r) < opt.tol) {
      op.converged = true;
      break;
    }
    op.iterations = it + 1;

    // J = d(r_anode, r_cathode)/d(a_acl, a_ccl)
    const double h1 = opt.fd_step * std::max(1.0, std::fabs(x.a_acl));
    const double h2 = opt.fd_step * std::max(1.0, std::fabs(x.a_ccl));

    UnknownActivities xp = x, xm = x;
    xp.a_acl += h1;
    xm.a_acl -= h1;
    Flux2 rp = flux_residual(stack, in, xp);
    Flux2 rm = flux_residual(stack, in, xm);
    const double J00 = (rp[0] - rm[0]) / (2.0 * h1);
    const double J10 = (rp[1] - rm[1]) / (2.0 * h1);

    xp = x;
    xm = x;
    xp.a_ccl += h2;
    xm.a_ccl -= h2;
    rp = flux_residual(stack, in, xp);
    rm = flux_residual(stack, in, xm);
    const double J01 = (rp[0] - rm[0]) / (2.0 * h2);
    const double J11 = (rp[1] - rm[1]) / (2.0 * h2);

    const double det = J00 * J11 - J01 * J10;
    if (!std::isfinite(det) || det == 0.0) break;

    double d1 = -(J11 * r[0] - J01 * r[1]) / det;
    double d2 = -(-J10 * r[0] + J00 * r[1]) / det;

    const double dmax = std::max(std::fabs(d1), std::fabs(d2));
    if (dmax > kMaxStep) {
      d1 *= kMaxStep / dmax;
      d2 *= kMaxStep / dmax;
    }

    x.a_acl += opt.damping * d1;
    x.a_ccl += opt.damping * d2;
    r = flux_residual(stack, in, x);
    if (!std::isfinite(r[0]) || !std::isfinite(r[1])) break;
  }
  if (!op.converged && max_abs(r) < opt.tol) op.converged = true;

  op.residual_norm = max_abs(r);
  op.evaluation = stack.evaluate(in, x);
  op.unknowns.activities = x;
  op.unknowns.voltage = op.evaluation.outputs.voltage;
  op.unknowns.heat_flow = -op.evaluation.energy.p_dissipated;
  return op;
}

std::vector<OperatingPoint> polarization_curve(const FuelCellStack& stack,
                                               const StackInputs& base,
                                               const std::vector<double>& current_densities,
                                               const SolverOptions& opt) {
  std::vector<OperatingPoint> out(current_densities.size());
  const long n = static_cast<long>(current_densities.size());

#ifdef PEMFC_HAS_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (long k = 0; k < n; ++k) {
    StackInputs in = base;
    in.current = -current_densities[k] * stack.params().cell_area;
    out[k] = solve_operating_point(stack, in, opt);
  }
  return out;
}

std::vector<double> linspace(double a, double b, std::size_t n) {
  if (n < 2) throw std::runtime_error("linspace: need at least 2 points");
  std::vector<double> v(n);
  const double d = (b - a) / static_cast<double>(n - 1);
  for (std::size_t k = 0; k < n; ++k) v[k] = a + d * static_cast<double>(k);
  v.back() = b;
  return v;
}

void write_operating_point_outputs(const StackConfig& cfg,
                                   const OperatingPoint& op,
                                   const std::string& subdir) {
  fs::path outdir(cfg.output_dir);
  if (!subdir.empty()) outdir /= subdir;
  ensure_dir(outdir.string());

  const StackEvaluation& ev = op.evaluation;

  // Voltage breakdown and membrane state as a single-row table.
  {
    std::vector<std::string> names = {"i", "V_nernst", "V_act", "V_ohm", "V_conc", "V_cell",
                                      "a_acl", "a_ccl", "lambda_avg", "sigma", "j_total"};
    std::vector<std::vector<double>> cols = {
        {ev.i}, {ev.voltage.nernst}, {ev.voltage.activation}, {ev.voltage.ohmic},
        {ev.voltage.concentration}, {ev.voltage.cell}, {op.unknowns.activities.a_acl},
        {op.unknowns.activities.a_ccl}, {ev.membrane.lambda_avg}, {ev.membrane.conductivity},
        {ev.membrane.j_total}};
    write_table((outdir / "operating_point.dat").string(), names, cols,
                "i [A/m^2], V [V], lambda [-], sigma [S/m], j [mol/(m^2 s)]");
  }

  ResultsIndex idx;
  idx.mode = "operating_point";
  idx.config_used = "config_used.ini";
  idx.summary["converged"] = op.converged ? "true" : "false";
  idx.summary["iterations"] = std::to_string(op.iterations);
  idx.summary["residual_norm"] = std::to_string(op.residual_norm);
  idx.summary["current_density_A_per_m2"] = std::to_string(ev.i);
  idx.summary["stack_voltage_V"] = std::to_string(ev.outputs.voltage);
  idx.summary["heat_flow_W"] = std::to_string(ev.outputs.heat_flow);
  idx.summary["electrical_power_W"] = std::to_string(ev.energy.p_electrical);
  idx.summary["h2_consumption_mol_per_s"] = std::to_string(ev.outputs.h2_consumption);
  idx.summary["o2_consumption_mol_per_s"] = std::to_string(ev.outputs.o2_consumption);
  idx.summary["h2o_production_mol_per_s"] = std::to_string(ev.outputs.h2o_production);
  idx.summary["water_transport_mol_per_s"] = std::to_string(ev.energy.transport_rate);

  idx.datasets["operating_point"] = DatasetMeta{
      "operating_point.dat",
      {"i", "V_nernst", "V_act", "V_ohm", "V_conc", "V_cell", "a_acl", "a_ccl", "lambda_avg", "sigma", "j_total"},
      "Cell voltage breakdown and membrane state at the configured current"};

  write_results_json(outdir.string(), idx);
}

void write_polarization_outputs(const StackConfig& cfg,
                                const std::vector<OperatingPoint>& curve,
                                const std::string& subdir) {
  fs::path outdir(cfg.output_dir);
  if (!subdir.empty()) outdir /= subdir;
  ensure_dir(outdir.string());

  std::vector<double> i, v_cell, v_stack, p_el, q, a_acl, a_ccl, conv;
  std::size_t n_converged = 0;
  for (const auto& op : curve) {
    i.push_back(op.current_density);
    v_cell.push_back(op.evaluation.voltage.cell);
    v_stack.push_back(op.evaluation.outputs.voltage);
    p_el.push_back(op.evaluation.energy.p_electrical);
    q.push_back(op.evaluation.outputs.heat_flow);
    a_acl.push_back(op.unknowns.activities.a_acl);
    a_ccl.push_back(op.unknowns.activities.a_ccl);
    conv.push_back(op.converged ? 1.0 : 0.0);
    if (op.converged) ++n_converged;
  }

  write_table((outdir / "polarization.dat").string(),
              {"i", "V_cell", "V_stack", "P_el", "Q", "a_acl", "a_ccl", "converged"},
              {i, v_cell, v_stack, p_el, q, a_acl, a_ccl, conv},
              "i [A/m^2], V [V], P [W], Q [W]");

  ResultsIndex idx;
  idx.mode = "polarization";
  idx.config_used = "config_used.ini";
  idx.summary["n_points"] = std::to_string(curve.size());
  idx.summary["n_converged"] = std::to_string(n_converged);
  idx.datasets["polarization"] = DatasetMeta{
      "polarization.dat",
      {"i", "V_cell", "V_stack", "P_el", "Q", "a_acl", "a_ccl", "converged"},
      "Steady-state polarization curve"};

  write_results_json(outdir.string(), idx);
}

} // namespace pemfc
