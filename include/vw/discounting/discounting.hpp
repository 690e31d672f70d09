#pragma once
/**
 * @file discounting.hpp
 * @brief Actualisation des flux et valeur terminale (Gordon–Shapiro).
 *
 * # Formules
 *   df_y = 1 / (1 + rate)^y,  y = 1..n
 *   PV_y = FCF_y * df_y
 *   TV   = FCF_n * (1 + g) / (rate - g)
 *   PV(TV) = TV * df_n
 *
 * # Valeur terminale : résultat étiqueté
 * - Si rate <= g, la formule donne +inf (rate == g) ou une valeur de signe
 *   inversé (rate < g), économiquement absurde. On renvoie alors un statut
 *   d’échec (RateNotAboveGrowth) avec value = NaN, jamais ±inf.
 * - Entrée ou quotient non fini ⇒ statut NonFinite (value = NaN).
 * - L’appelant décide : l’agrégateur lève ValuationError, la grille de
 *   sensibilité pose une sentinelle NaN sur la cellule.
 */

#include <cstddef> // std::size_t
#include <string>
#include <vector>

#include <vw/model/assumptions.hpp>

namespace vw {
namespace discounting {

/// @brief Issue du calcul de valeur terminale.
enum class TvStatus {
  Ok,                  ///< Valeur finie, rate > g.
  RateNotAboveGrowth,  ///< rate <= g : perpétuité non convergente.
  NonFinite            ///< Entrée ou résultat non fini (NaN/inf).
};

/// @brief Résultat étiqueté (succès avec valeur / échec avec raison).
struct TerminalValueResult {
  double   value;   ///< TV si status == Ok, NaN sinon.
  TvStatus status;  ///< Raison de l’échec éventuel.

  bool ok() const noexcept { return status == TvStatus::Ok; }
};

/// @brief Libellé court d’un statut (pour les messages d’erreur).
std::string to_string(TvStatus s);

/**
 * @brief Facteurs d’actualisation des années 1..n.
 * @param rate Taux d’actualisation (décimal).
 * @param n    Nombre d’années (5 par défaut).
 * @return df[y-1] = 1 / (1 + rate)^y.
 */
std::vector<double> discount_factors(double rate,
                                     std::size_t n = vw::model::kForecastYears);

/// @brief PV élément par élément.
/// @throws std::invalid_argument si les tailles diffèrent.
std::vector<double> present_values(const std::vector<double>& cashflows,
                                   const std::vector<double>& factors);

/**
 * @brief Valeur terminale par perpétuité croissante.
 * @param final_fcf        FCF de la dernière année projetée.
 * @param terminal_growth  Croissance perpétuelle g.
 * @param rate             Taux d’actualisation.
 */
TerminalValueResult terminal_value(double final_fcf,
                                   double terminal_growth,
                                   double rate) noexcept;

/// @brief PV de la valeur terminale (actualisée avec le facteur de l’année n).
double pv_terminal_value(double tv, double final_discount_factor) noexcept;

} // namespace discounting
} // namespace vw
