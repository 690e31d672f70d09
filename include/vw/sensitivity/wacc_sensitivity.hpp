#pragma once
/**
 * @file wacc_sensitivity.hpp
 * @brief Sensibilité de l’EV au WACC (bump & reprice central, ±1 pt par défaut).
 *
 * # Estimateur
 *   S ≈ [ EV(wacc - h) − EV(wacc + h) ] / (2 * EV(wacc))
 * Variation relative d’EV par point de WACC (h = 0.01 ⇒ 1 pt).
 * Positive pour un DCF usuel (l’EV décroît avec le WACC).
 *
 * # Conventions
 * - Trois valorisations complètes via run_valuation (base, +h, −h) ;
 *   toutes les autres hypothèses restent fixes (y compris g).
 * - wacc − h <= g ⇒ ValuationError (Field::WaccBump).
 * - EV de base nulle ou non finie (marge ou conversion à 0…) ⇒ ValuationError
 *   (Field::ZeroBaseValue), jamais un NaN renvoyé.
 * - Échec du cas de base ⇒ ValuationError (Field::Wacc / Projection) propagée telle quelle.
 */

#include <vw/model/assumptions.hpp>

namespace vw {
namespace sensitivity {

/// @brief Résultat de la sensibilité ±WACC.
struct WaccSensitivity {
  double sensitivity; ///< (ev_minus − ev_plus) / (2 * base_ev).
  double base_ev;     ///< EV de référence.
  double ev_plus;     ///< EV à wacc + bump.
  double ev_minus;    ///< EV à wacc − bump.
  double bump;        ///< Bump absolu utilisé.
};

/**
 * @brief Sensibilité centrée de l’EV au WACC.
 * @param a     Hypothèses de base.
 * @param bump  Bump absolu (> 0), 0.01 par défaut.
 * @throws std::invalid_argument si bump <= 0.
 * @throws vw::valuation::ValuationError si une des valorisations échoue
 *         ou si l’EV de base vaut 0.
 */
[[nodiscard]] WaccSensitivity wacc_sensitivity(const vw::model::Assumptions& a,
                                               double bump = 0.01);

} // namespace sensitivity
} // namespace vw
