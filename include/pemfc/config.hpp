#pragma once

#include <pemfc/gas_properties.hpp>
#include <pemfc/profile.hpp>
#include <pemfc/types.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace pemfc {

// Parsed INI as section->(key->value).
using IniSection = std::map<std::string, std::string>;
using IniMap = std::map<std::string, IniSection>;

// Thrown when CellStackParameters break their invariants. what() lists every
// violated constraint, one per line.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(std::vector<std::string> violations);

  const std::vector<std::string>& violations() const { return violations_; }

private:
  std::vector<std::string> violations_;
};

struct SweepConfig {
  bool enabled = false;
  double i_min = 0.0;        // [A/m^2]
  double i_max = 12000.0;    // [A/m^2]
  std::size_t n_points = 25;
};

struct StackConfig {
  // [general]
  std::string output_dir = "out";
  bool verify = true;
  int omp_threads = 0;              // 0 => leave as-is

  // [stack] [kinetics] [transport] [membrane]
  CellStackParameters params;

  // [properties]
  Extrapolation extrapolation = Extrapolation::Linear;
  DomainOverrides anode_props;
  DomainOverrides cathode_props;

  // [operating]
  double current_density = 5000.0;  // [A/m^2], discharging
  StackInputs inputs;               // current is filled from current_density

  // [solver]
  SolverOptions solver;

  // [sweep]
  SweepConfig sweep;

  // Convenience: report what was parsed.
  IniMap ini_raw;
};

IniMap parse_ini_file(const std::string& path);
StackConfig load_config(const std::string& ini_path);

// Reference operating point: 80 C, humidified hydrogen and air near 1.5 bar.
StackInputs reference_inputs();

// Throws ConfigurationError listing all violated parameter invariants.
void validate_parameters(const CellStackParameters& p);

} // namespace pemfc
