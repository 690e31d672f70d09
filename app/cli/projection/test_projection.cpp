#include "vw/projection/projection.hpp"
#include "vw/config/input_bounds.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

static vw::model::Assumptions make(std::vector<double> g, double margin = 0.20) {
  return vw::model::Assumptions(100.0, std::move(g), margin, 0.25, 0.10, 0.03, 0.80);
}

int main() {
  constexpr double EPS = 1e-9;

  // 1) CA composé année par année
  const auto rev = vw::projection::project_revenue(100.0, {0.15, 0.12, 0.10, 0.08, 0.06});
  assert(rev.size() == 5);
  assert(std::abs(rev[0] - 115.0) < EPS);
  assert(std::abs(rev[1] - 128.8) < EPS);
  assert(std::abs(rev[4] - 162.195264) < 1e-6);

  // 2) Chaîne EBIT -> NOPAT -> FCF
  const auto p = vw::projection::project(vw::config::default_assumptions());
  assert(p.revenues.size() == 5 && p.ebits.size() == 5 && p.nopats.size() == 5 && p.fcfs.size() == 5);
  for (std::size_t i = 0; i < 5; ++i) {
    assert(std::abs(p.ebits[i]  - p.revenues[i] * 0.20) < EPS);
    assert(std::abs(p.nopats[i] - p.ebits[i] * 0.75) < EPS);
    assert(std::abs(p.fcfs[i]   - p.nopats[i] * 0.80) < EPS);
  }
  assert(std::abs(p.fcfs[4] - 19.46343168) < 1e-6);

  // 3) Croissance nulle : CA constant
  const auto flat = vw::projection::project(make({0, 0, 0, 0, 0}));
  for (double r : flat.revenues) assert(std::abs(r - 100.0) < EPS);

  // 4) Croissance négative : CA décroissant, reste positif
  const auto down = vw::projection::project(make({-0.10, -0.10, -0.10, -0.10, -0.10}));
  for (std::size_t i = 1; i < 5; ++i) assert(down.revenues[i] < down.revenues[i-1]);
  assert(down.revenues.back() > 0.0);

  // 5) Monotonie : relever le taux de l’année k relève CA, EBIT, NOPAT et FCF
  //    des années k..5, les années antérieures sont inchangées
  const auto lo = vw::projection::project(make({0.05, 0.05, 0.05, 0.05, 0.05}));
  for (std::size_t k = 0; k < 5; ++k) {
    std::vector<double> g(5, 0.05);
    g[k] = 0.10;
    const auto hi = vw::projection::project(make(g));
    for (std::size_t i = 0; i < 5; ++i) {
      if (i < k) {
        assert(hi.revenues[i] == lo.revenues[i]);
        assert(hi.fcfs[i] == lo.fcfs[i]);
      } else {
        assert(hi.revenues[i] > lo.revenues[i]);
        assert(hi.ebits[i]    > lo.ebits[i]);
        assert(hi.nopats[i]   > lo.nopats[i]);
        assert(hi.fcfs[i]     > lo.fcfs[i]);
      }
    }
  }

  // 6) Marge négative : FCF négatifs, pas d’erreur
  const auto loss = vw::projection::project(make({0.05, 0.05, 0.05, 0.05, 0.05}, -0.05));
  for (double f : loss.fcfs) assert(f < 0.0);

  // 7) Nombre de taux != 5 rejeté à la construction
  bool threw = false;
  try { make({0.1, 0.1, 0.1}); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  std::cout << "Projection OK. Y5 FCF=" << p.fcfs[4] << "\n";
  return 0;
}
