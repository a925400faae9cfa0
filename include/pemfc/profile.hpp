#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pemfc {

enum class Extrapolation { Linear, Nearest };

Extrapolation parse_extrapolation(const std::string& name);
const char* to_string(Extrapolation e);

// Temperature-indexed property table on a strictly increasing abscissa with
// piecewise-linear interpolation. Outside the tabulated range the value is
// either continued along the end segment (Linear) or held (Nearest).
class PropertyTable {
public:
  std::vector<double> x;
  std::vector<double> val;
  Extrapolation extrapolation = Extrapolation::Linear;

  PropertyTable() = default;
  PropertyTable(std::vector<double> x_in, std::vector<double> v_in,
                Extrapolation extrap = Extrapolation::Linear);

  std::size_t size() const { return x.size(); }
  bool empty() const { return x.empty(); }

  double eval(double x_query) const;
  std::vector<double> eval_on(const std::vector<double>& x_query) const;
};

} // namespace pemfc
