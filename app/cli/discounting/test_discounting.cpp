#include "vw/discounting/discounting.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

int main() {
  using namespace vw::discounting;
  constexpr double EPS = 1e-12;

  // 1) Facteurs : df_1 = 1/(1+r), décroissants, dans ]0,1[
  const auto df = discount_factors(0.10);
  assert(df.size() == 5);
  assert(std::abs(df[0] - 1.0 / 1.10) < EPS);
  assert(std::abs(df[4] - 1.0 / std::pow(1.10, 5)) < EPS);
  for (std::size_t i = 0; i < df.size(); ++i) {
    assert(df[i] > 0.0 && df[i] < 1.0);
    if (i > 0) assert(df[i] < df[i-1]);
  }

  // 2) Taux nul : tous les facteurs valent 1
  for (double d : discount_factors(0.0)) assert(d == 1.0);
  assert(discount_factors(0.10, 3).size() == 3);

  // 3) PV élément par élément ; tailles différentes rejetées
  const auto pv = present_values({10.0, 20.0}, {0.5, 0.25});
  assert(pv.size() == 2 && pv[0] == 5.0 && pv[1] == 5.0);
  bool threw = false;
  try { (void)present_values({1.0, 2.0, 3.0}, {1.0}); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 4) TV de Gordon
  const auto tv = terminal_value(19.46343168, 0.03, 0.10);
  assert(tv.ok());
  assert(std::abs(tv.value - 19.46343168 * 1.03 / 0.07) < 1e-9);
  assert(std::abs(pv_terminal_value(tv.value, df[4]) - tv.value * df[4]) < EPS);

  // 5) rate == g et rate < g : échec étiqueté, jamais ±inf
  const auto eq = terminal_value(10.0, 0.05, 0.05);
  assert(!eq.ok() && eq.status == TvStatus::RateNotAboveGrowth && std::isnan(eq.value));
  const auto inv = terminal_value(10.0, 0.08, 0.05);
  assert(!inv.ok() && inv.status == TvStatus::RateNotAboveGrowth && std::isnan(inv.value));

  // 6) Entrée non finie
  const auto nf = terminal_value(std::numeric_limits<double>::infinity(), 0.02, 0.10);
  assert(nf.status == TvStatus::NonFinite && std::isnan(nf.value));
  const auto nan_rate = terminal_value(10.0, 0.02, std::numeric_limits<double>::quiet_NaN());
  assert(nan_rate.status == TvStatus::NonFinite);

  // 7) TV croissante en g, décroissante en rate
  assert(terminal_value(10.0, 0.04, 0.10).value > terminal_value(10.0, 0.03, 0.10).value);
  assert(terminal_value(10.0, 0.03, 0.12).value < terminal_value(10.0, 0.03, 0.10).value);

  assert(to_string(TvStatus::Ok) == "ok");

  std::cout << "Discounting OK. TV=" << tv.value << "\n";
  return 0;
}
