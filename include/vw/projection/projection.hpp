#pragma once
/**
 * @file projection.hpp
 * @brief Projection opérationnelle sur l’horizon explicite (CA, EBIT, NOPAT, FCF).
 *
 * # Formules (année y = 1..n, CA_0 = current_revenue)
 *   CA_y    = CA_{y-1} * (1 + g_y)
 *   EBIT_y  = CA_y * marge
 *   NOPAT_y = EBIT_y * (1 - impôt)
 *   FCF_y   = NOPAT_y * conversion
 *
 * # Conventions
 * - L’année 0 n’est PAS incluse dans les séries retournées.
 * - Ratios constants sur l’horizon (pas de marge/impôt variables par année).
 * - Aucune validation des entrées : fonctions totales sur les réels.
 *   La validation relève de la couche de saisie (config/input_bounds.hpp).
 */

#include <vector>

#include <vw/model/assumptions.hpp>

namespace vw {
namespace projection {

/// @brief Séries projetées, années 1..n.
struct Projection {
  std::vector<double> revenues; ///< CA projeté.
  std::vector<double> ebits;    ///< EBIT.
  std::vector<double> nopats;   ///< Résultat opérationnel après impôt.
  std::vector<double> fcfs;     ///< Free cash flow.
};

/// @brief CA des années 1..n, composé à partir de current_revenue.
std::vector<double> project_revenue(double current_revenue,
                                    const std::vector<double>& growth_rates);

/// @brief EBIT = CA * marge (élément par élément).
std::vector<double> calculate_ebit(const std::vector<double>& revenues, double ebit_margin);

/// @brief NOPAT = EBIT * (1 - impôt).
std::vector<double> calculate_nopat(const std::vector<double>& ebits, double tax_rate);

/// @brief FCF = NOPAT * conversion.
std::vector<double> calculate_fcf(const std::vector<double>& nopats, double fcf_conversion);

/// @brief Enchaîne les quatre étapes pour un jeu d’hypothèses.
Projection project(const vw::model::Assumptions& a);

} // namespace projection
} // namespace vw
