#include <vw/valuation/valuation.hpp>
#include <vw/projection/projection.hpp>

#include <cmath>     // std::isfinite
#include <limits>
#include <numeric>   // std::accumulate
#include <sstream>
#include <stdexcept>
#include <utility>   // std::move

namespace {

std::string describe(vw::valuation::ValuationError::Field field, double wacc,
                     double tg, vw::discounting::TvStatus status, double base_ev) {
  using Field = vw::valuation::ValuationError::Field;
  std::ostringstream os;
  os << "ValuationError: ";
  switch (field) {
    case Field::WaccBump:
      os << "perturbed WACC " << wacc << " must stay above terminal growth " << tg;
      break;
    case Field::Projection:
      os << "projected free cash flows are not finite (check revenue, growth, margin,"
         << " tax and FCF conversion); WACC " << wacc << ", terminal growth " << tg;
      break;
    case Field::ZeroBaseValue:
      os << "base enterprise value base_ev=" << base_ev
         << " must be finite and non-zero for a relative WACC sensitivity (WACC "
         << wacc << ", terminal growth " << tg << ")";
      return os.str();
    case Field::Wacc:
      os << "WACC " << wacc << " must be > terminal growth " << tg;
      break;
  }
  os << " (" << vw::discounting::to_string(status) << ")";
  return os.str();
}

} // namespace

namespace vw {
namespace valuation {

ValuationError::ValuationError(Field field, double wacc, double terminal_growth,
                               vw::discounting::TvStatus status)
    : std::invalid_argument(describe(field, wacc, terminal_growth, status,
                                     std::numeric_limits<double>::quiet_NaN())),
      field_(field),
      wacc_(wacc),
      terminal_growth_(terminal_growth),
      status_(status) {}

ValuationError::ValuationError(Field field, double wacc, double terminal_growth,
                               double base_enterprise_value)
    : std::invalid_argument(describe(field, wacc, terminal_growth,
                                     vw::discounting::TvStatus::Ok, base_enterprise_value)),
      field_(field),
      wacc_(wacc),
      terminal_growth_(terminal_growth),
      status_(vw::discounting::TvStatus::Ok),
      base_ev_(base_enterprise_value) {}

EnterpriseValue aggregate_enterprise_value(const std::vector<double>& pv_fcfs,
                                           double pv_terminal_value) noexcept {
  const double pv_forecast = std::accumulate(pv_fcfs.begin(), pv_fcfs.end(), 0.0);
  return {pv_forecast, pv_forecast + pv_terminal_value};
}

DiscountedCashFlows discount_cash_flows(const std::vector<double>& fcfs,
                                        double rate,
                                        double terminal_growth) {
  using namespace vw::discounting;

  if (fcfs.empty()) {
    throw std::invalid_argument("discount_cash_flows: empty FCF series");
  }

  DiscountedCashFlows out;
  out.discount_factors = discount_factors(rate, fcfs.size());
  out.pv_fcfs          = present_values(fcfs, out.discount_factors);
  out.terminal         = terminal_value(fcfs.back(), terminal_growth, rate);

  if (!out.terminal.ok()) {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
    out.pv_terminal_value  = NaN;
    out.pv_forecast_period = aggregate_enterprise_value(out.pv_fcfs, 0.0).pv_forecast_period;
    out.enterprise_value   = NaN;
    return out;
  }

  out.pv_terminal_value = pv_terminal_value(out.terminal.value, out.discount_factors.back());
  const EnterpriseValue ev = aggregate_enterprise_value(out.pv_fcfs, out.pv_terminal_value);
  out.pv_forecast_period = ev.pv_forecast_period;
  out.enterprise_value   = ev.enterprise_value;
  return out;
}

ValuationResult run_valuation(const vw::model::Assumptions& a) {
  vw::projection::Projection p = vw::projection::project(a);
  DiscountedCashFlows d = discount_cash_flows(p.fcfs, a.wacc, a.terminal_growth);

  if (!d.terminal.ok()) {
    // NonFinite avec wacc et g finis : c’est la projection qui a dégénéré
    const bool rates_finite = std::isfinite(a.wacc) && std::isfinite(a.terminal_growth);
    const auto field = (d.terminal.status == vw::discounting::TvStatus::NonFinite && rates_finite)
                         ? ValuationError::Field::Projection
                         : ValuationError::Field::Wacc;
    throw ValuationError(field, a.wacc, a.terminal_growth, d.terminal.status);
  }

  return ValuationResult{
    std::move(p.revenues),
    std::move(p.ebits),
    std::move(p.nopats),
    std::move(p.fcfs),
    std::move(d.discount_factors),
    std::move(d.pv_fcfs),
    d.terminal.value,
    d.pv_terminal_value,
    d.pv_forecast_period,
    d.enterprise_value
  };
}

} // namespace valuation
} // namespace vw
