#include <pemfc/profile.hpp>

#include <algorithm>
#include <stdexcept>

namespace pemfc {

namespace {

void require_monotonic(const std::vector<double>& x, const std::string& name) {
  if (x.size() < 2) {
    throw std::runtime_error(name + ": need at least 2 points");
  }
  for (std::size_t i = 1; i < x.size(); ++i) {
    if (!(x[i] > x[i - 1])) {
      throw std::runtime_error(name + ": abscissa must be strictly increasing");
    }
  }
}

std::size_t upper_index(const std::vector<double>& x, double xq) {
  // return i such that x[i-1] <= xq < x[i], with i in [1, n-1].
  auto it = std::upper_bound(x.begin(), x.end(), xq);
  if (it == x.begin()) return 1;
  if (it == x.end()) return x.size() - 1;
  return static_cast<std::size_t>(it - x.begin());
}

} // namespace

Extrapolation parse_extrapolation(const std::string& name) {
  if (name == "linear") return Extrapolation::Linear;
  if (name == "nearest") return Extrapolation::Nearest;
  throw std::runtime_error("extrapolation must be 'linear' or 'nearest', got '" + name + "'");
}

const char* to_string(Extrapolation e) {
  return e == Extrapolation::Linear ? "linear" : "nearest";
}

PropertyTable::PropertyTable(std::vector<double> x_in, std::vector<double> v_in, Extrapolation extrap)
    : x(std::move(x_in)), val(std::move(v_in)), extrapolation(extrap) {
  if (x.size() != val.size()) {
    throw std::runtime_error("PropertyTable: x and val size mismatch");
  }
  require_monotonic(x, "PropertyTable::x");
}

double PropertyTable::eval(double x_query) const {
  if (x.empty()) {
    throw std::runtime_error("PropertyTable::eval: empty table");
  }
  if (extrapolation == Extrapolation::Nearest) {
    if (x_query <= x.front()) return val.front();
    if (x_query >= x.back()) return val.back();
  }

  // Linear: the end segments are continued beyond the range.
  std::size_t i = upper_index(x, x_query);
  std::size_t i0 = i - 1;
  std::size_t i1 = i;

  double x0 = x[i0], x1 = x[i1];
  double t = (x_query - x0) / (x1 - x0);
  return (1.0 - t) * val[i0] + t * val[i1];
}

std::vector<double> PropertyTable::eval_on(const std::vector<double>& x_query) const {
  std::vector<double> out;
  out.reserve(x_query.size());
  for (double xq : x_query) out.push_back(eval(xq));
  return out;
}

} // namespace pemfc
