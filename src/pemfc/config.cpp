#include <pemfc/config.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace pemfc {

namespace {

std::string trim(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  std::size_t j = s.size();
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool parse_bool(const std::string& v) {
  std::string x = to_lower(trim(v));
  return (x == "1" || x == "true" || x == "yes" || x == "on");
}

double parse_double(const std::string& v) {
  std::string x = trim(v);
  if (x.empty()) throw std::runtime_error("parse_double: empty");
  char* end = nullptr;
  double out = std::strtod(x.c_str(), &end);
  if (end == x.c_str() || *end != '\0') {
    throw std::runtime_error("parse_double: invalid number '" + v + "'");
  }
  return out;
}

std::size_t parse_size(const std::string& v) {
  double d = parse_double(v);
  if (d < 0.0) throw std::runtime_error("parse_size: negative");
  return static_cast<std::size_t>(d);
}

int parse_int(const std::string& v) {
  double d = parse_double(v);
  return static_cast<int>(d);
}

std::string get_str(const IniMap& ini, const std::string& sec, const std::string& key,
                    const std::string& def) {
  auto sit = ini.find(sec);
  if (sit == ini.end()) return def;
  auto kit = sit->second.find(key);
  if (kit == sit->second.end()) return def;
  return trim(kit->second);
}

std::optional<std::string> get_str_opt(const IniMap& ini, const std::string& sec, const std::string& key) {
  auto sit = ini.find(sec);
  if (sit == ini.end()) return std::nullopt;
  auto kit = sit->second.find(key);
  if (kit == sit->second.end()) return std::nullopt;
  return trim(kit->second);
}

double get_double(const IniMap& ini, const std::string& sec, const std::string& key, double def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_double(*v) : def;
}

std::optional<double> get_double_opt(const IniMap& ini, const std::string& sec, const std::string& key) {
  auto v = get_str_opt(ini, sec, key);
  if (!v) return std::nullopt;
  return parse_double(*v);
}

int get_int(const IniMap& ini, const std::string& sec, const std::string& key, int def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_int(*v) : def;
}

std::size_t get_size(const IniMap& ini, const std::string& sec, const std::string& key, std::size_t def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_size(*v) : def;
}

bool get_bool(const IniMap& ini, const std::string& sec, const std::string& key, bool def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_bool(*v) : def;
}

GasState get_gas_state(const IniMap& ini, const std::string& port, const GasState& def) {
  GasState g = def;
  g.p = get_double(ini, "operating", port + ".p", g.p);
  g.T = get_double(ini, "operating", port + ".T", g.T);
  g.x_h2o = get_double(ini, "operating", port + ".x_h2o", g.x_h2o);
  g.x_gas = get_double(ini, "operating", port + ".x_gas", g.x_gas);
  return g;
}

// Relative table paths are taken relative to the INI file.
DomainOverrides get_domain_overrides(const IniMap& ini, const std::string& domain,
                                     const std::filesystem::path& base_dir) {
  DomainOverrides o;
  o.R_water = get_double_opt(ini, "properties", domain + ".R_water");
  o.R_gas = get_double_opt(ini, "properties", domain + ".R_gas");
  for (const char* table : {"log_psat", "h_water", "h_gas", "h_fg", "mu_water"}) {
    auto f = get_str_opt(ini, "properties", domain + "." + table + "_file");
    if (!f || f->empty()) continue;
    std::filesystem::path path(*f);
    if (path.is_relative()) path = base_dir / path;
    o.table_files[table] = path.string();
  }
  return o;
}

std::string join_lines(const std::vector<std::string>& v) {
  std::string out = "Invalid stack parameters:";
  for (const auto& s : v) out += "\n  - " + s;
  return out;
}

void require_positive(std::vector<std::string>& bad, const char* name, double v) {
  if (!(v > 0.0) || !std::isfinite(v)) {
    std::ostringstream ss;
    ss << name << " must be strictly positive (got " << v << ")";
    bad.push_back(ss.str());
  }
}

void check_port(const GasState& g, const std::string& port) {
  if (!(g.p > 0.0)) throw std::runtime_error("[operating] " + port + ".p must be positive");
  if (g.x_h2o < 0.0 || g.x_gas < 0.0 || g.x_h2o + g.x_gas > 1.0 + 1e-12) {
    throw std::runtime_error("[operating] " + port + " mole fractions must be in [0,1] and sum to <= 1");
  }
}

} // namespace

ConfigurationError::ConfigurationError(std::vector<std::string> violations)
    : std::runtime_error(join_lines(violations)), violations_(std::move(violations)) {}

void validate_parameters(const CellStackParameters& p) {
  std::vector<std::string> bad;
  require_positive(bad, "n_cells", p.n_cells);
  require_positive(bad, "cell_area", p.cell_area);
  require_positive(bad, "membrane_thickness", p.membrane_thickness);
  require_positive(bad, "gdl_thickness", p.gdl_thickness);
  require_positive(bad, "exchange_current_density", p.exchange_current_density);
  require_positive(bad, "limiting_current_density", p.limiting_current_density);
  require_positive(bad, "charge_transfer_coefficient", p.charge_transfer_coefficient);
  require_positive(bad, "gdl_vapor_diffusivity", p.gdl_vapor_diffusivity);
  require_positive(bad, "membrane_water_diffusivity", p.membrane_water_diffusivity);
  require_positive(bad, "dry_density", p.dry_density);
  require_positive(bad, "equivalent_weight", p.equivalent_weight);
  require_positive(bad, "permeability", p.permeability);

  if (!(p.limiting_current_density > p.exchange_current_density)) {
    std::ostringstream ss;
    ss << "limiting_current_density (" << p.limiting_current_density
       << ") must exceed exchange_current_density (" << p.exchange_current_density << ")";
    bad.push_back(ss.str());
  }

  if (!bad.empty()) throw ConfigurationError(std::move(bad));
}

StackInputs reference_inputs() {
  StackInputs in;
  in.T_stack = 353.15;

  in.anode.inflow.p = 1.50e5;
  in.anode.inflow.T = 353.15;
  in.anode.inflow.x_h2o = 0.20;
  in.anode.inflow.x_gas = 0.80;
  in.anode.outflow.p = 1.45e5;
  in.anode.outflow.T = 353.15;
  in.anode.outflow.x_h2o = 0.25;
  in.anode.outflow.x_gas = 0.75;

  in.cathode.inflow.p = 1.50e5;
  in.cathode.inflow.T = 353.15;
  in.cathode.inflow.x_h2o = 0.15;
  in.cathode.inflow.x_gas = 0.18;
  in.cathode.outflow.p = 1.45e5;
  in.cathode.outflow.T = 353.15;
  in.cathode.outflow.x_h2o = 0.30;
  in.cathode.outflow.x_gas = 0.12;
  return in;
}

IniMap parse_ini_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Cannot open config INI: " + path);
  }

  IniMap ini;
  std::string current = "general"; // default if no section
  ini[current] = IniSection{};

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;

    // Strip comments (# or ;)
    auto hash = line.find('#');
    auto semi = line.find(';');
    std::size_t cut = std::string::npos;
    if (hash != std::string::npos) cut = hash;
    if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) continue;

    if (line.front() == '[' && line.back() == ']') {
      current = trim(line.substr(1, line.size() - 2));
      if (current.empty()) {
        throw std::runtime_error("INI parse error: empty section at line " + std::to_string(lineno));
      }
      ini[current];
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error("INI parse error: expected key=value at line " + std::to_string(lineno));
    }
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (key.empty()) {
      throw std::runtime_error("INI parse error: empty key at line " + std::to_string(lineno));
    }
    ini[current][key] = val;
  }

  return ini;
}

StackConfig load_config(const std::string& ini_path) {
  StackConfig cfg;
  cfg.ini_raw = parse_ini_file(ini_path);

  const IniMap& ini = cfg.ini_raw;

  cfg.output_dir = get_str(ini, "general", "output_dir", cfg.output_dir);
  cfg.verify = get_bool(ini, "general", "verify", cfg.verify);
  cfg.omp_threads = get_int(ini, "general", "omp_threads", cfg.omp_threads);

  // stack geometry
  CellStackParameters& p = cfg.params;
  p.n_cells = get_double(ini, "stack", "n_cells", p.n_cells);
  p.cell_area = get_double(ini, "stack", "cell_area", p.cell_area);
  p.membrane_thickness = get_double(ini, "stack", "membrane_thickness", p.membrane_thickness);
  p.gdl_thickness = get_double(ini, "stack", "gdl_thickness", p.gdl_thickness);

  // kinetics
  p.exchange_current_density = get_double(ini, "kinetics", "exchange_current_density", p.exchange_current_density);
  p.limiting_current_density = get_double(ini, "kinetics", "limiting_current_density", p.limiting_current_density);
  p.charge_transfer_coefficient =
      get_double(ini, "kinetics", "charge_transfer_coefficient", p.charge_transfer_coefficient);

  // transport
  p.gdl_vapor_diffusivity = get_double(ini, "transport", "gdl_vapor_diffusivity", p.gdl_vapor_diffusivity);
  p.membrane_water_diffusivity =
      get_double(ini, "transport", "membrane_water_diffusivity", p.membrane_water_diffusivity);

  // membrane
  p.dry_density = get_double(ini, "membrane", "dry_density", p.dry_density);
  p.equivalent_weight = get_double(ini, "membrane", "equivalent_weight", p.equivalent_weight);
  p.permeability = get_double(ini, "membrane", "permeability", p.permeability);

  // properties
  cfg.extrapolation = parse_extrapolation(to_lower(get_str(ini, "properties", "extrapolation", "linear")));
  const std::filesystem::path ini_dir = std::filesystem::path(ini_path).parent_path();
  cfg.anode_props = get_domain_overrides(ini, "anode", ini_dir);
  cfg.cathode_props = get_domain_overrides(ini, "cathode", ini_dir);

  // operating point
  StackInputs ref = reference_inputs();
  cfg.current_density = get_double(ini, "operating", "current_density", cfg.current_density);
  cfg.inputs.T_stack = get_double(ini, "operating", "stack_temperature", ref.T_stack);
  cfg.inputs.anode.inflow = get_gas_state(ini, "anode_in", ref.anode.inflow);
  cfg.inputs.anode.outflow = get_gas_state(ini, "anode_out", ref.anode.outflow);
  cfg.inputs.cathode.inflow = get_gas_state(ini, "cathode_in", ref.cathode.inflow);
  cfg.inputs.cathode.outflow = get_gas_state(ini, "cathode_out", ref.cathode.outflow);
  cfg.inputs.current = -cfg.current_density * p.cell_area;

  // solver
  cfg.solver.max_iter = get_int(ini, "solver", "max_iter", cfg.solver.max_iter);
  cfg.solver.tol = get_double(ini, "solver", "tol", cfg.solver.tol);
  cfg.solver.fd_step = get_double(ini, "solver", "fd_step", cfg.solver.fd_step);
  cfg.solver.damping = get_double(ini, "solver", "damping", cfg.solver.damping);
  cfg.solver.initial.a_acl = get_double(ini, "solver", "a_acl_init", cfg.solver.initial.a_acl);
  cfg.solver.initial.a_ccl = get_double(ini, "solver", "a_ccl_init", cfg.solver.initial.a_ccl);

  // sweep
  cfg.sweep.enabled = get_bool(ini, "sweep", "enabled", cfg.sweep.enabled);
  cfg.sweep.i_min = get_double(ini, "sweep", "i_min", cfg.sweep.i_min);
  cfg.sweep.i_max = get_double(ini, "sweep", "i_max", cfg.sweep.i_max);
  cfg.sweep.n_points = get_size(ini, "sweep", "n_points", cfg.sweep.n_points);

  // physical invariants first, they are the ones users get wrong
  validate_parameters(cfg.params);

  // basic sanity
  if (cfg.current_density < 0.0) throw std::runtime_error("[operating] current_density must be >= 0");
  if (!(cfg.inputs.T_stack > 0.0)) throw std::runtime_error("[operating] stack_temperature must be positive");
  check_port(cfg.inputs.anode.inflow, "anode_in");
  check_port(cfg.inputs.anode.outflow, "anode_out");
  check_port(cfg.inputs.cathode.inflow, "cathode_in");
  check_port(cfg.inputs.cathode.outflow, "cathode_out");

  if (cfg.solver.max_iter < 1) throw std::runtime_error("[solver] max_iter must be >= 1");
  if (!(cfg.solver.tol > 0.0)) throw std::runtime_error("[solver] tol must be positive");
  if (!(cfg.solver.fd_step > 0.0)) throw std::runtime_error("[solver] fd_step must be positive");
  if (cfg.solver.damping <= 0.0 || cfg.solver.damping > 1.0) throw std::runtime_error("[solver] damping must be in (0,1]");

  if (cfg.sweep.enabled) {
    if (cfg.sweep.n_points < 2) throw std::runtime_error("[sweep] n_points must be >= 2");
    if (cfg.sweep.i_min < 0.0 || !(cfg.sweep.i_max > cfg.sweep.i_min)) {
      throw std::runtime_error("[sweep] need 0 <= i_min < i_max");
    }
  }

  return cfg;
}

} // namespace pemfc
