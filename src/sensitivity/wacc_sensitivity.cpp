#include <vw/sensitivity/wacc_sensitivity.hpp>
#include <vw/valuation/valuation.hpp>

#include <cmath>
#include <stdexcept>

namespace vw {
namespace sensitivity {

WaccSensitivity wacc_sensitivity(const vw::model::Assumptions& a, double bump) {
  using vw::valuation::ValuationError;

  if (!(bump > 0.0)) {
    throw std::invalid_argument("wacc_sensitivity: bump must be > 0");
  }

  const double base_ev = vw::valuation::run_valuation(a).enterprise_value;
  if (base_ev == 0.0 || !std::isfinite(base_ev)) {
    throw ValuationError(ValuationError::Field::ZeroBaseValue, a.wacc, a.terminal_growth, base_ev);
  }
  const double ev_plus = vw::valuation::run_valuation(a.with_wacc(a.wacc + bump)).enterprise_value;

  // Le bump bas ne doit pas franchir g : on requalifie l’erreur.
  double ev_minus = 0.0;
  try {
    ev_minus = vw::valuation::run_valuation(a.with_wacc(a.wacc - bump)).enterprise_value;
  } catch (const ValuationError& e) {
    if (e.field() != ValuationError::Field::Wacc) throw;
    throw ValuationError(ValuationError::Field::WaccBump, e.wacc(), e.terminal_growth(), e.status());
  }

  return { (ev_minus - ev_plus) / (2.0 * base_ev), base_ev, ev_plus, ev_minus, bump };
}

} // namespace sensitivity
} // namespace vw
