#pragma once
/**
 * @file sensitivity_config.hpp
 * @brief Configuration standard de l’analyse de sensibilité (grille + bump WACC).
 *
 * # Contenu
 * - wacc_min / wacc_max / n_wacc : axe des colonnes (taux d’actualisation).
 * - tg_min / tg_max / n_tg       : axe des lignes (croissance terminale).
 * - wacc_bump                    : bump absolu pour la sensibilité ±WACC (+0.01 = 1 pt).
 * - n_threads                    : tâches pour la grille (1 = séquentiel).
 *
 * # Valeurs par défaut
 * - WACC 6 % → 14 % (9 points), g 2 % → 5 % (7 points) : aucune cellule
 *   infaisable (min WACC 6 % > max g 5 %).
 *
 * # Remarques
 * - Axes régulièrement espacés, bornes incluses (cf. sensitivity::linspace).
 */

#include <cstddef> // std::size_t
#include <vector>

namespace vw {
namespace config {

/// @brief Configuration d’une analyse de sensibilité.
struct SensitivityConfig {
  double      wacc_min;   ///< Premier WACC de la grille.
  double      wacc_max;   ///< Dernier WACC de la grille.
  std::size_t n_wacc;     ///< Nombre de colonnes.
  double      tg_min;     ///< Première croissance terminale.
  double      tg_max;     ///< Dernière croissance terminale.
  std::size_t n_tg;       ///< Nombre de lignes.
  double      wacc_bump;  ///< Bump absolu pour wacc_sensitivity.
  std::size_t n_threads;  ///< Parallélisme de la grille (>= 1).

  /// @brief Construit une configuration avec valeurs par défaut.
  SensitivityConfig(double      wacc_min  = 0.06,
                    double      wacc_max  = 0.14,
                    std::size_t n_wacc    = 9,
                    double      tg_min    = 0.02,
                    double      tg_max    = 0.05,
                    std::size_t n_tg      = 7,
                    double      wacc_bump = 0.01,
                    std::size_t n_threads = 1) noexcept
      : wacc_min(wacc_min),
        wacc_max(wacc_max),
        n_wacc(n_wacc),
        tg_min(tg_min),
        tg_max(tg_max),
        n_tg(n_tg),
        wacc_bump(wacc_bump),
        n_threads(n_threads) {}

  /// @return Axe des colonnes (WACC).
  std::vector<double> rate_axis() const;

  /// @return Axe des lignes (croissance terminale).
  std::vector<double> growth_axis() const;
};

} // namespace config
} // namespace vw
