#include <vw/valuation/insights.hpp>

#include <cmath>
#include <limits>

namespace {
// Ratio protégé : NaN si le dénominateur est nul ou non fini.
inline double ratio(double num, double den) noexcept {
  if (den == 0.0 || !std::isfinite(den)) return std::numeric_limits<double>::quiet_NaN();
  return num / den;
}
} // namespace

namespace vw {
namespace valuation {

ValuationInsights compute_insights(const vw::model::Assumptions& a,
                                   const ValuationResult& r) noexcept {
  constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

  const double ev        = r.enterprise_value;
  const double rev_final = r.revenues.empty() ? NaN : r.revenues.back();
  const double ebit_final = r.ebits.empty() ? NaN : r.ebits.back();
  const double years     = static_cast<double>(r.revenues.size());

  ValuationInsights out{};
  out.revenue_multiple    = ratio(ev, a.current_revenue);
  out.ev_to_final_revenue = ratio(ev, rev_final);
  out.ebitda_multiple_est = ratio(ev, ebit_final / (1.0 - a.tax_rate));
  out.terminal_share      = ratio(r.pv_terminal_value, ev);
  out.forecast_share      = ratio(r.pv_forecast_period, ev);

  const double growth_factor = ratio(rev_final, a.current_revenue);
  out.revenue_cagr = (years > 0.0 && growth_factor > 0.0)
                       ? std::pow(growth_factor, 1.0 / years) - 1.0
                       : NaN;

  out.wacc_tg_spread           = a.wacc - a.terminal_growth;
  out.high_terminal_dependency = out.terminal_share > kHighTerminalShare;
  out.narrow_spread            = out.wacc_tg_spread < kNarrowSpread;
  return out;
}

} // namespace valuation
} // namespace vw
