#include <vw/sensitivity/sensitivity_grid.hpp>
#include <vw/projection/projection.hpp>
#include <vw/valuation/valuation.hpp>

#include <algorithm>
#include <future>
#include <stdexcept>

namespace vw {
namespace sensitivity {

namespace {

// Remplit les lignes [row_begin, row_end) ; aucune autre écriture.
void fill_rows(const std::vector<double>& fcfs, SensitivityGrid& grid,
               std::size_t row_begin, std::size_t row_end) {
  const std::size_t R = grid.cols();
  for (std::size_t i = row_begin; i < row_end; ++i) {
    const double g = grid.growth_axis[i];
    for (std::size_t j = 0; j < R; ++j) {
      const auto d = vw::valuation::discount_cash_flows(fcfs, grid.rate_axis[j], g);
      grid.values[i * R + j] = d.enterprise_value; // NaN si TV en échec
      grid.status[i * R + j] = d.terminal.status;
    }
  }
}

} // unnamed namespace

std::size_t SensitivityGrid::infeasible_count() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(status.begin(), status.end(),
                    [](vw::discounting::TvStatus s) { return s != vw::discounting::TvStatus::Ok; }));
}

std::vector<double> linspace(double lo, double hi, std::size_t n) {
  std::vector<double> out;
  if (n == 0) return out;
  out.reserve(n);
  if (n == 1) { out.push_back(lo); return out; }
  const double step = (hi - lo) / static_cast<double>(n - 1);
  for (std::size_t i = 0; i < n; ++i) out.push_back(lo + step * static_cast<double>(i));
  out.back() = hi; // borne haute exacte
  return out;
}

SensitivityGrid sensitivity_grid(const std::vector<double>& fcfs,
                                 const std::vector<double>& rate_values,
                                 const std::vector<double>& growth_values,
                                 std::size_t n_threads) {
  if (fcfs.empty()) {
    throw std::invalid_argument("sensitivity_grid: empty FCF series");
  }

  SensitivityGrid grid;
  grid.rate_axis   = rate_values;
  grid.growth_axis = growth_values;
  grid.values.assign(grid.rows() * grid.cols(), 0.0);
  grid.status.assign(grid.rows() * grid.cols(), vw::discounting::TvStatus::Ok);

  const std::size_t G = grid.rows();
  const std::size_t tasks = std::min<std::size_t>(std::max<std::size_t>(n_threads, 1), std::max<std::size_t>(G, 1));

  if (tasks <= 1) {
    fill_rows(fcfs, grid, 0, G);
    return grid;
  }

  // Découpage contigu des lignes : chaque tâche possède ses cellules.
  const std::size_t per_task = (G + tasks - 1) / tasks;
  std::vector<std::future<void>> futures;
  futures.reserve(tasks);
  for (std::size_t t = 0; t < tasks; ++t) {
    const std::size_t b = t * per_task;
    const std::size_t e = std::min(G, b + per_task);
    if (b >= e) break;
    futures.push_back(std::async(std::launch::async,
                                 [&fcfs, &grid, b, e]() { fill_rows(fcfs, grid, b, e); }));
  }
  for (auto& f : futures) f.get(); // relance une éventuelle exception de tâche

  return grid;
}

SensitivityGrid sensitivity_grid(const vw::model::Assumptions& a,
                                 const vw::config::SensitivityConfig& cfg) {
  const vw::projection::Projection p = vw::projection::project(a);
  return sensitivity_grid(p.fcfs, cfg.rate_axis(), cfg.growth_axis(), cfg.n_threads);
}

} // namespace sensitivity
} // namespace vw
