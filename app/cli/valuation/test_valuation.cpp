#include "vw/valuation/valuation.hpp"
#include "vw/valuation/insights.hpp"
#include "vw/config/input_bounds.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

using vw::model::Assumptions;

static Assumptions reference() {
  return Assumptions(100.0, {0.15, 0.12, 0.10, 0.08, 0.06}, 0.20, 0.25, 0.10, 0.03, 0.80);
}

int main() {
  using namespace vw::valuation;
  constexpr double TOL = 0.01;

  // 1) Scénario de référence (valeurs recalculées à la main)
  const auto r = run_valuation(reference());
  assert(std::abs(r.revenues.back()    - 162.195264) < TOL);
  assert(std::abs(r.fcfs.back()        - 19.463432)  < TOL);
  assert(std::abs(r.terminal_value     - 286.390495) < TOL);
  assert(std::abs(r.pv_terminal_value  - 177.825965) < TOL);
  assert(std::abs(r.pv_forecast_period - 62.719129)  < TOL);
  assert(std::abs(r.enterprise_value   - 240.545094) < TOL);

  // 2) Identité EV = somme(PV) + PV(TV)
  const double sum_pv = std::accumulate(r.pv_fcfs.begin(), r.pv_fcfs.end(), 0.0);
  assert(std::abs(r.pv_forecast_period - sum_pv) < 1e-9);
  assert(std::abs(r.enterprise_value - (sum_pv + r.pv_terminal_value)) < 1e-9);
  assert(r.discount_factors.size() == 5 && r.pv_fcfs.size() == 5);

  // 3) Idempotence : mêmes entrées => mêmes sorties, bit à bit
  const auto r2 = run_valuation(reference());
  assert(r2.enterprise_value == r.enterprise_value);
  assert(r2.pv_fcfs == r.pv_fcfs);

  // 4) Monotonie : EV décroît en WACC, croît en g et en croissance
  const auto base = reference();
  assert(run_valuation(base.with_wacc(0.11)).enterprise_value < r.enterprise_value);
  assert(run_valuation(base.with_terminal_growth(0.04)).enterprise_value > r.enterprise_value);
  for (std::size_t k = 0; k < 5; ++k) {
    std::vector<double> g = base.growth_rates;
    g[k] += 0.02;
    const Assumptions faster(100.0, g, 0.20, 0.25, 0.10, 0.03, 0.80);
    const auto rf = run_valuation(faster);
    assert(rf.enterprise_value > r.enterprise_value);
    assert(rf.pv_terminal_value > r.pv_terminal_value);
    for (std::size_t i = k; i < 5; ++i) assert(rf.fcfs[i] > r.fcfs[i]);
  }

  // 5) wacc <= g : ValuationError, champ Wacc, valeurs dans le message
  for (double g : {0.10, 0.12}) {
    bool threw = false;
    try {
      (void)run_valuation(base.with_terminal_growth(g));
    } catch (const ValuationError& e) {
      threw = true;
      assert(e.field() == ValuationError::Field::Wacc);
      assert(e.wacc() == 0.10 && e.terminal_growth() == g);
      assert(e.status() == vw::discounting::TvStatus::RateNotAboveGrowth);
      assert(std::string(e.what()).find("WACC") != std::string::npos);
    }
    assert(threw);
  }

  // 5b) FCF non finis (marge NaN) : erreur imputée à la projection, pas au WACC
  {
    const Assumptions nan_margin(100.0, {0.15, 0.12, 0.10, 0.08, 0.06},
                                 std::numeric_limits<double>::quiet_NaN(), 0.25, 0.10, 0.03, 0.80);
    bool threw = false;
    try {
      (void)run_valuation(nan_margin);
    } catch (const ValuationError& e) {
      threw = true;
      assert(e.field() == ValuationError::Field::Projection);
      assert(e.status() == vw::discounting::TvStatus::NonFinite);
      const std::string msg = e.what();
      assert(msg.find("projected free cash flows are not finite") != std::string::npos);
      assert(msg.find("must be > terminal growth") == std::string::npos);
    }
    assert(threw);

    // WACC non fini : reste imputé au WACC
    threw = false;
    try {
      (void)run_valuation(base.with_wacc(std::numeric_limits<double>::infinity()));
    } catch (const ValuationError& e) {
      threw = true;
      assert(e.field() == ValuationError::Field::Wacc);
    }
    assert(threw);
  }

  // 6) Flux actualisés : TV en échec => NaN, PV de l’horizon conservée
  const auto d = discount_cash_flows(r.fcfs, 0.03, 0.03);
  assert(!d.terminal.ok());
  assert(std::isnan(d.enterprise_value) && std::isnan(d.pv_terminal_value));
  assert(std::isfinite(d.pv_forecast_period));
  bool threw = false;
  try { (void)discount_cash_flows({}, 0.10, 0.03); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 7) Indicateurs
  const auto ins = compute_insights(base, r);
  assert(std::abs(ins.revenue_multiple - r.enterprise_value / 100.0) < 1e-12);
  assert(std::abs(ins.ev_to_final_revenue - r.enterprise_value / r.revenues.back()) < 1e-12);
  assert(std::abs(ins.ebitda_multiple_est - 5.561470) < 1e-4);
  assert(std::abs(ins.terminal_share + ins.forecast_share - 1.0) < 1e-12);
  assert(std::abs(ins.terminal_share - 0.739262) < 1e-4);
  assert(std::abs(ins.revenue_cagr - (std::pow(1.62195264, 0.2) - 1.0)) < 1e-9);
  assert(std::abs(ins.wacc_tg_spread - 0.07) < 1e-12);
  assert(!ins.high_terminal_dependency && !ins.narrow_spread);

  const auto tight = base.with_terminal_growth(0.08);
  const auto ins2 = compute_insights(tight, run_valuation(tight));
  assert(ins2.high_terminal_dependency && ins2.narrow_spread);

  std::cout << "Valuation OK. EV=" << r.enterprise_value << "\n";
  return 0;
}
