#pragma once
/**
 * @file valuation_error.hpp
 * @brief Erreur levée quand une valorisation ne peut pas aboutir.
 *
 * Porte le contexte nécessaire pour corriger l’entrée : quelle hypothèse
 * (Field), les valeurs wacc / g utilisées et le statut de la valeur terminale.
 * Pour ZeroBaseValue, base_enterprise_value() donne l’EV de référence fautive.
 */

#include <limits>
#include <stdexcept> // std::invalid_argument
#include <string>

#include <vw/discounting/discounting.hpp>

namespace vw {
namespace valuation {

class ValuationError : public std::invalid_argument {
public:
  /// @brief Hypothèse en cause.
  enum class Field {
    Wacc,          ///< wacc <= terminal_growth sur le cas de base.
    WaccBump,      ///< wacc - bump <= terminal_growth (sensibilité ±bump).
    Projection,    ///< FCF projetés non finis (CA, croissance, marge, conversion).
    ZeroBaseValue  ///< EV de base nulle ou non finie : sensibilité relative indéfinie.
  };

  ValuationError(Field field, double wacc, double terminal_growth,
                 vw::discounting::TvStatus status);

  /// @brief Échec sur l’EV de base (statut de TV = Ok).
  ValuationError(Field field, double wacc, double terminal_growth,
                 double base_enterprise_value);

  Field field() const noexcept { return field_; }
  double wacc() const noexcept { return wacc_; }
  double terminal_growth() const noexcept { return terminal_growth_; }
  vw::discounting::TvStatus status() const noexcept { return status_; }
  double base_enterprise_value() const noexcept { return base_ev_; }

private:
  Field field_;
  double wacc_;
  double terminal_growth_;
  vw::discounting::TvStatus status_;
  double base_ev_ = std::numeric_limits<double>::quiet_NaN();
};

} // namespace valuation
} // namespace vw
