#pragma once
/**
 * @file insights.hpp
 * @brief Indicateurs dérivés d’une valorisation (multiples, répartition, alertes).
 *
 * # Indicateurs
 * - revenue_multiple     = EV / CA_0
 * - ev_to_final_revenue  = EV / CA_5
 * - ebitda_multiple_est  = EV / (EBIT_5 / (1 − impôt))   (estimation grossière)
 * - terminal_share       = PV(TV) / EV
 * - forecast_share       = somme(PV) / EV
 * - revenue_cagr         = (CA_5 / CA_0)^(1/5) − 1
 * - wacc_tg_spread       = wacc − g
 *
 * # Alertes
 * - high_terminal_dependency : terminal_share > 75 %.
 * - narrow_spread            : wacc − g < 3 pts (résultats peu fiables).
 */

#include <vw/model/assumptions.hpp>
#include <vw/valuation/valuation.hpp>

namespace vw {
namespace valuation {

constexpr double kHighTerminalShare = 0.75;
constexpr double kNarrowSpread      = 0.03;

struct ValuationInsights {
  double revenue_multiple;
  double ev_to_final_revenue;
  double ebitda_multiple_est;
  double terminal_share;
  double forecast_share;
  double revenue_cagr;
  double wacc_tg_spread;
  bool   high_terminal_dependency;
  bool   narrow_spread;
};

/// @brief Calcule les indicateurs d’un résultat (ratios NaN si dénominateur nul).
ValuationInsights compute_insights(const vw::model::Assumptions& a,
                                   const ValuationResult& r) noexcept;

} // namespace valuation
} // namespace vw
