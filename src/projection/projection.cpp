#include <vw/projection/projection.hpp>

namespace vw {
namespace projection {

namespace {
// Applique un ratio constant à chaque élément d’une série.
inline std::vector<double> scale(const std::vector<double>& xs, double k) {
  std::vector<double> out;
  out.reserve(xs.size());
  for (double x : xs) out.push_back(x * k);
  return out;
}
} // unnamed namespace

std::vector<double> project_revenue(double current_revenue,
                                    const std::vector<double>& growth_rates) {
  std::vector<double> out;
  out.reserve(growth_rates.size());
  double prev = current_revenue; // année 0, non retournée
  for (double g : growth_rates) {
    prev = prev * (1.0 + g);
    out.push_back(prev);
  }
  return out;
}

std::vector<double> calculate_ebit(const std::vector<double>& revenues, double ebit_margin) {
  return scale(revenues, ebit_margin);
}

std::vector<double> calculate_nopat(const std::vector<double>& ebits, double tax_rate) {
  return scale(ebits, 1.0 - tax_rate);
}

std::vector<double> calculate_fcf(const std::vector<double>& nopats, double fcf_conversion) {
  return scale(nopats, fcf_conversion);
}

Projection project(const vw::model::Assumptions& a) {
  Projection p;
  p.revenues = project_revenue(a.current_revenue, a.growth_rates);
  p.ebits    = calculate_ebit(p.revenues, a.ebit_margin);
  p.nopats   = calculate_nopat(p.ebits, a.tax_rate);
  p.fcfs     = calculate_fcf(p.nopats, a.fcf_conversion);
  return p;
}

} // namespace projection
} // namespace vw
