#pragma once
/**
 * @file sensitivity_grid.hpp
 * @brief Grille de sensibilité EV(g, WACC) à projection fixe.
 *
 * # Principe
 * - Les FCF sont projetés UNE fois (ils ne dépendent ni du WACC ni de g).
 * - Pour chaque couple (ligne g_i, colonne r_j) : facteurs d’actualisation
 *   pour r_j, PV des FCF, TV et PV(TV) avec (r_j, g_i), somme ⇒ EV.
 * - Même arithmétique que valuation::run_valuation (discount_cash_flows) :
 *   la cellule au (wacc, g) du cas de base vaut exactement l’EV de base.
 *
 * # Cellules infaisables (r_j <= g_i ou résultat non fini)
 * - Politique : sentinelle. values = NaN, status = statut d’échec de la TV.
 * - La grille n’est jamais interrompue ; les autres cellules sont intactes.
 * - infeasible_count() / is_feasible() pour l’affichage (cellule grisée…).
 *
 * # Parallélisme
 * - n_threads > 1 : lignes réparties sur des tâches std::async. Chaque
 *   cellule est écrite par une seule tâche, sans réduction croisée ⇒
 *   résultat identique bit à bit au séquentiel.
 */

#include <cstddef> // std::size_t
#include <vector>

#include <vw/model/assumptions.hpp>
#include <vw/discounting/discounting.hpp>
#include <vw/config/sensitivity_config.hpp>

namespace vw {
namespace sensitivity {

/// @brief Matrice EV indexée (ligne = croissance terminale, colonne = WACC).
struct SensitivityGrid {
  std::vector<double> rate_axis;    ///< Colonnes (WACC), taille R.
  std::vector<double> growth_axis;  ///< Lignes (g), taille G.
  std::vector<double> values;       ///< G*R, ligne par ligne ; NaN si infaisable.
  std::vector<vw::discounting::TvStatus> status; ///< Statut par cellule.

  std::size_t rows() const noexcept { return growth_axis.size(); }
  std::size_t cols() const noexcept { return rate_axis.size(); }

  /// @return EV en (ligne g, colonne WACC). NaN si cellule infaisable.
  double at(std::size_t row, std::size_t col) const { return values.at(row * cols() + col); }

  bool is_feasible(std::size_t row, std::size_t col) const {
    return status.at(row * cols() + col) == vw::discounting::TvStatus::Ok;
  }

  /// @return Nombre de cellules portant la sentinelle.
  std::size_t infeasible_count() const noexcept;
};

/// @brief n points régulièrement espacés de lo à hi inclus ({lo} si n == 1).
std::vector<double> linspace(double lo, double hi, std::size_t n);

/**
 * @brief Balaye (g, WACC) sur une série de FCF déjà projetée.
 * @param fcfs          FCF années 1..n (non vide).
 * @param rate_values   Axe des colonnes.
 * @param growth_values Axe des lignes.
 * @param n_threads     Tâches parallèles (0 ou 1 = séquentiel).
 * @throws std::invalid_argument si fcfs est vide.
 */
SensitivityGrid sensitivity_grid(const std::vector<double>& fcfs,
                                 const std::vector<double>& rate_values,
                                 const std::vector<double>& growth_values,
                                 std::size_t n_threads = 1);

/// @brief Projette puis balaye les axes de la configuration.
SensitivityGrid sensitivity_grid(const vw::model::Assumptions& a,
                                 const vw::config::SensitivityConfig& cfg);

} // namespace sensitivity
} // namespace vw
