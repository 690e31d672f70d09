#pragma once
/**
 * @file assumptions.hpp
 * @brief Hypothèses d’une valorisation DCF (entrée immuable du moteur).
 *
 * # Contenu
 * - current_revenue : chiffre d’affaires de l’année 0, en $M (> 0 attendu).
 * - growth_rates    : 5 taux de croissance annuels (décimal), années 1..5.
 * - ebit_margin     : EBIT / CA, constant sur l’horizon.
 * - tax_rate        : taux d’impôt (décimal, dans [0, 1)).
 * - wacc            : taux d’actualisation (décimal).
 * - terminal_growth : croissance perpétuelle (décimal).
 * - fcf_conversion  : FCF / NOPAT (0.8 par défaut).
 *
 * # Domaines valides
 * - wacc > terminal_growth obligatoire pour une valeur terminale finie.
 *   Ce n’est PAS vérifié ici : le moteur d’actualisation le détecte et
 *   l’agrégateur le remonte (ValuationError).
 * - Les bornes "raisonnables" (sliders de l’UI) sont dans config/input_bounds.hpp.
 *
 * # Unités
 * - Montants en millions ($M), taux en décimal (0.10 = 10 %).
 */

#include <cstddef>   // std::size_t
#include <stdexcept> // std::invalid_argument
#include <utility>   // std::move
#include <vector>

namespace vw {
namespace model {

/// @brief Horizon explicite de prévision (années 1..5).
constexpr std::size_t kForecastYears = 5;

/// @brief Conversion NOPAT → FCF par défaut.
constexpr double kDefaultFcfConversion = 0.8;

/**
 * @brief Hypothèses d’une valorisation DCF.
 *
 * Immuables après construction.
 */
struct Assumptions {
public:
  const double current_revenue;            ///< CA année 0 ($M).
  const std::vector<double> growth_rates;  ///< Croissance années 1..5 (décimal).
  const double ebit_margin;                ///< Marge d’EBIT (décimal).
  const double tax_rate;                   ///< Taux d’impôt (décimal).
  const double wacc;                       ///< Taux d’actualisation (décimal).
  const double terminal_growth;            ///< Croissance perpétuelle (décimal).
  const double fcf_conversion;             ///< FCF / NOPAT (décimal).

  /// @brief Construit un jeu d’hypothèses.
  /// @throws std::invalid_argument si growth_rates ne contient pas 5 valeurs.
  Assumptions(double current_revenue,
              std::vector<double> growth_rates,
              double ebit_margin,
              double tax_rate,
              double wacc,
              double terminal_growth,
              double fcf_conversion = kDefaultFcfConversion)
      : current_revenue(current_revenue),
        growth_rates(std::move(growth_rates)),
        ebit_margin(ebit_margin),
        tax_rate(tax_rate),
        wacc(wacc),
        terminal_growth(terminal_growth),
        fcf_conversion(fcf_conversion) {
    if (this->growth_rates.size() != kForecastYears) {
      throw std::invalid_argument("Assumptions: growth_rates must hold exactly 5 values");
    }
  }

  /// @return Copie avec un autre WACC (toutes les autres hypothèses inchangées).
  Assumptions with_wacc(double new_wacc) const {
    return Assumptions(current_revenue, growth_rates, ebit_margin, tax_rate,
                       new_wacc, terminal_growth, fcf_conversion);
  }

  /// @return Copie avec une autre croissance terminale.
  Assumptions with_terminal_growth(double new_tg) const {
    return Assumptions(current_revenue, growth_rates, ebit_margin, tax_rate,
                       wacc, new_tg, fcf_conversion);
  }
};

} // namespace model
} // namespace vw
