#pragma once
/**
 * @file valuation.hpp
 * @brief Agrégation DCF : valeur d’entreprise et résultat complet.
 *
 * # Principe
 *   EV = somme(PV_y) + PV(TV)
 *
 * # Point d’entrée
 * - run_valuation() est le SEUL point d’entrée d’une valorisation de base :
 *   projection → actualisation → agrégation, un résultat immuable.
 * - discount_cash_flows() est le cœur partagé avec la grille de sensibilité :
 *   même arithmétique, donc une cellule (wacc, g) == EV du cas de base.
 *
 * # Erreurs
 * - wacc <= terminal_growth ⇒ ValuationError (Field::Wacc). Aucun résultat
 *   partiel n’est renvoyé.
 * - FCF projetés non finis (wacc et g finis) ⇒ ValuationError (Field::Projection).
 */

#include <vector>

#include <vw/model/assumptions.hpp>
#include <vw/discounting/discounting.hpp>
#include <vw/valuation/valuation_error.hpp>

namespace vw {
namespace valuation {

/// @brief Somme des PV de l’horizon et valeur d’entreprise.
struct EnterpriseValue {
  double pv_forecast_period; ///< somme(PV_y).
  double enterprise_value;   ///< pv_forecast_period + PV(TV).
};

/// @brief Flux actualisés pour un couple (rate, g) donné.
/// @note Si !terminal.ok(), pv_terminal_value et enterprise_value valent NaN.
struct DiscountedCashFlows {
  std::vector<double> discount_factors;
  std::vector<double> pv_fcfs;
  vw::discounting::TerminalValueResult terminal;
  double pv_terminal_value;
  double pv_forecast_period;
  double enterprise_value;
};

/// @brief Résultat complet d’une valorisation (lecture seule).
struct ValuationResult {
  const std::vector<double> revenues;
  const std::vector<double> ebits;
  const std::vector<double> nopats;
  const std::vector<double> fcfs;
  const std::vector<double> discount_factors;
  const std::vector<double> pv_fcfs;
  const double terminal_value;
  const double pv_terminal_value;
  const double pv_forecast_period;
  const double enterprise_value;
};

/// @brief EV = somme(pv_fcfs) + pv_terminal_value.
EnterpriseValue aggregate_enterprise_value(const std::vector<double>& pv_fcfs,
                                           double pv_terminal_value) noexcept;

/**
 * @brief Actualise une série de FCF déjà projetée.
 * @param fcfs             FCF années 1..n (n >= 1).
 * @param rate             Taux d’actualisation.
 * @param terminal_growth  Croissance perpétuelle.
 * @throws std::invalid_argument si fcfs est vide.
 */
DiscountedCashFlows discount_cash_flows(const std::vector<double>& fcfs,
                                        double rate,
                                        double terminal_growth);

/**
 * @brief Valorisation DCF complète du cas de base.
 * @throws ValuationError si wacc <= terminal_growth (Field::Wacc)
 *         ou si les FCF projetés ne sont pas finis (Field::Projection).
 */
ValuationResult run_valuation(const vw::model::Assumptions& a);

} // namespace valuation
} // namespace vw
