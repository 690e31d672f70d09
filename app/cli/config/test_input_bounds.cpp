#include "vw/config/input_bounds.hpp"
#include "vw/config/sensitivity_config.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using vw::model::Assumptions;

static bool has_msg(const std::vector<vw::config::InputIssue>& v, const std::string& needle, bool blocking) {
  return std::any_of(v.begin(), v.end(), [&](const vw::config::InputIssue& i) {
    return i.blocking == blocking && i.message.find(needle) != std::string::npos;
  });
}

int main() {
  using namespace vw::config;

  // 1) Défauts du tableau de bord
  const auto& b = default_bounds();
  assert(b.current_revenue.default_value == 100.0);
  assert(b.growth[0].default_value == 15.0 && b.growth[4].default_value == 6.0);
  assert(b.wacc.min == 5.0 && b.wacc.max == 15.0);
  assert(b.terminal_growth.step == 0.25);

  const Assumptions d = default_assumptions();
  assert(d.current_revenue == 100.0);
  assert(d.growth_rates[1] == 0.12);
  assert(d.ebit_margin == 0.20 && d.tax_rate == 0.25);
  assert(d.wacc == 0.10 && d.terminal_growth == 0.03 && d.fcf_conversion == 0.80);
  assert(from_percent(12.5) == 0.125);

  // 2) Défauts : aucun message
  assert(check_assumptions(d).empty());

  // 3) Hors bornes : message non bloquant
  const Assumptions hi_wacc = d.with_wacc(0.20);
  const auto i1 = check_assumptions(hi_wacc);
  assert(i1.size() == 1);
  assert(has_msg(i1, "WACC", false));
  assert(!has_blocking_issue(i1));

  // 4) wacc <= g : bloquant
  const auto i2 = check_assumptions(d.with_terminal_growth(0.10));
  assert(has_blocking_issue(i2));
  assert(has_msg(i2, "must be greater than terminal growth", true));

  // 5) CA nul, impôt >= 1, valeur non finie
  const Assumptions bad(0.0, {0.1, 0.1, 0.1, 0.1, 0.1}, 0.2, 1.0, 0.10, 0.03);
  const auto i3 = check_assumptions(bad);
  assert(has_msg(i3, "Current revenue must be > 0", true));
  assert(has_msg(i3, "Tax rate", true));
  const Assumptions nan_margin(100.0, {0.1, 0.1, 0.1, 0.1, 0.1},
                               std::numeric_limits<double>::quiet_NaN(), 0.25, 0.10, 0.03);
  assert(has_msg(check_assumptions(nan_margin), "not finite", true));

  // 6) Config de sensibilité par défaut
  const SensitivityConfig cfg;
  const auto ra = cfg.rate_axis();
  const auto ga = cfg.growth_axis();
  assert(ra.size() == 9 && ga.size() == 7);
  assert(ra.front() == 0.06 && ra.back() == 0.14);
  assert(ga.front() == 0.02 && ga.back() == 0.05);
  assert(std::abs(ga[2] - 0.03) < 1e-12);
  assert(cfg.wacc_bump == 0.01 && cfg.n_threads == 1);

  std::cout << "Input bounds OK.\n";
  return 0;
}
