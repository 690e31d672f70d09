#include "vw/sensitivity/sensitivity_grid.hpp"
#include "vw/sensitivity/wacc_sensitivity.hpp"
#include "vw/valuation/valuation.hpp"
#include "vw/projection/projection.hpp"
#include "vw/config/input_bounds.hpp"
#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main() {
  using namespace vw::sensitivity;
  using vw::discounting::TvStatus;
  using vw::valuation::ValuationError;

  const auto a = vw::config::default_assumptions();
  const double base_ev = vw::valuation::run_valuation(a).enterprise_value;
  const auto fcfs = vw::projection::project(a).fcfs;

  // 1) linspace : bornes incluses, cas dégénérés
  const auto ax = linspace(0.06, 0.14, 9);
  assert(ax.size() == 9 && ax.front() == 0.06 && ax.back() == 0.14);
  assert(std::abs(ax[4] - 0.10) < 1e-12);
  assert(linspace(0.02, 0.05, 1).size() == 1 && linspace(0.02, 0.05, 1)[0] == 0.02);
  assert(linspace(0.0, 1.0, 0).empty());

  // 2) Cohérence grille / cas de base : cellule (0.10, 0.03) == EV de base
  const auto g1 = sensitivity_grid(fcfs, {0.08, 0.10, 0.12}, {0.02, 0.03});
  assert(g1.rows() == 2 && g1.cols() == 3);
  assert(g1.at(1, 1) == base_ev);
  assert(g1.infeasible_count() == 0);

  // 3) Monotonie : EV décroît le long d’une ligne, croît le long d’une colonne
  for (std::size_t i = 0; i < g1.rows(); ++i)
    for (std::size_t j = 1; j < g1.cols(); ++j) assert(g1.at(i, j) < g1.at(i, j-1));
  for (std::size_t j = 0; j < g1.cols(); ++j) assert(g1.at(1, j) > g1.at(0, j));

  // 4) Grille par défaut (9 x 7) : aucune cellule infaisable
  const auto gdef = sensitivity_grid(a, vw::config::SensitivityConfig());
  assert(gdef.rows() == 7 && gdef.cols() == 9);
  assert(gdef.infeasible_count() == 0);
  for (double v : gdef.values) assert(std::isfinite(v) && v > 0.0);

  // 5) Sentinelle : rate <= g => NaN + statut, reste de la grille intact
  const auto g2 = sensitivity_grid(fcfs, {0.03, 0.05, 0.10}, {0.03, 0.05});
  assert(g2.infeasible_count() == 3);
  assert(!g2.is_feasible(0, 0) && std::isnan(g2.at(0, 0)));
  assert(g2.status[0] == TvStatus::RateNotAboveGrowth);
  assert(!g2.is_feasible(1, 0) && !g2.is_feasible(1, 1));
  assert(g2.is_feasible(0, 1) && std::isfinite(g2.at(0, 1)));
  assert(g2.is_feasible(1, 2) && std::isfinite(g2.at(1, 2)));

  // 6) Parallèle == séquentiel, bit à bit
  vw::config::SensitivityConfig big(0.04, 0.16, 25, 0.0, 0.06, 13);
  const auto seq = sensitivity_grid(a, big);
  big.n_threads = 4;
  const auto par = sensitivity_grid(a, big);
  assert(seq.values.size() == par.values.size());
  assert(std::memcmp(seq.values.data(), par.values.data(), seq.values.size() * sizeof(double)) == 0);
  assert(seq.status == par.status);
  assert(seq.infeasible_count() > 0);

  // 7) FCF vides rejetés
  bool threw = false;
  try { (void)sensitivity_grid(std::vector<double>{}, {0.1}, {0.02}); }
  catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 8) Sensibilité ±WACC : positive, cohérente avec trois valorisations
  const auto ws = wacc_sensitivity(a);
  assert(ws.sensitivity > 0.0);
  assert(ws.base_ev == base_ev);
  assert(std::abs(ws.sensitivity - (ws.ev_minus - ws.ev_plus) / (2.0 * base_ev)) < 1e-15);
  assert(std::abs(ws.sensitivity - 0.149336) < 1e-5);
  assert(ws.ev_minus > base_ev && base_ev > ws.ev_plus);

  // 9) Bump dégénéré : wacc - bump <= g
  threw = false;
  try {
    (void)wacc_sensitivity(a.with_wacc(0.035));
  } catch (const ValuationError& e) {
    threw = true;
    assert(e.field() == ValuationError::Field::WaccBump);
  }
  assert(threw);

  // 10) Bump invalide
  threw = false;
  try { (void)wacc_sensitivity(a, 0.0); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 11) EV de base nulle (marge ou conversion à 0) : erreur explicite, pas de NaN
  for (const auto& zero : {vw::model::Assumptions(100.0, {0.15, 0.12, 0.10, 0.08, 0.06}, 0.0, 0.25, 0.10, 0.03, 0.8),
                           vw::model::Assumptions(100.0, {0.15, 0.12, 0.10, 0.08, 0.06}, 0.2, 0.25, 0.10, 0.03, 0.0)}) {
    threw = false;
    try {
      (void)wacc_sensitivity(zero);
    } catch (const ValuationError& e) {
      threw = true;
      assert(e.field() == ValuationError::Field::ZeroBaseValue);
      assert(e.base_enterprise_value() == 0.0);
      assert(std::string(e.what()).find("base_ev") != std::string::npos);
    }
    assert(threw);
  }

  std::cout << "Sensitivity OK. S=" << ws.sensitivity << "\n";
  return 0;
}
