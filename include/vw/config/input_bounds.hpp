#pragma once
/**
 * @file input_bounds.hpp
 * @brief Bornes, pas et valeurs par défaut des hypothèses saisies (couche d’entrée).
 *
 * # Objet
 * Les front-ends (CLI, GUI) sollicitent des valeurs brutes ; ce module porte
 * les plages admises, les défauts et la conversion pourcentage → décimal,
 * pour que le moteur ne reçoive que des hypothèses vérifiées.
 *
 * # Unités
 * - Toutes les bornes sont en POURCENT, sauf le CA (en $M).
 * - from_percent(15.0) == 0.15.
 *
 * # Contrôles (check_assumptions)
 * - Une ligne de message par borne violée (diagnostic, non bloquant).
 * - wacc <= terminal_growth : message bloquant (la valorisation échouerait).
 */

#include <array>
#include <string>
#include <vector>

#include <vw/model/assumptions.hpp>

namespace vw {
namespace config {

/// @brief Plage admise pour une hypothèse saisie.
struct InputBound {
  const char* label;  ///< Libellé affichable.
  double min;         ///< Borne basse (pourcent, ou $M pour le CA).
  double max;         ///< Borne haute.
  double default_value; ///< Valeur par défaut.
  double step;        ///< Pas de saisie.
};

/// @brief Bornes de l’ensemble des hypothèses.
struct InputBounds {
  InputBound current_revenue;
  std::array<InputBound, vw::model::kForecastYears> growth;
  InputBound ebit_margin;
  InputBound tax_rate;
  InputBound wacc;
  InputBound terminal_growth;
  InputBound fcf_conversion;
};

/// @return Bornes standard du tableau de bord.
const InputBounds& default_bounds() noexcept;

/// @brief Pourcent → décimal.
constexpr double from_percent(double pct) noexcept { return pct / 100.0; }

/// @brief Décimal → pourcent.
constexpr double to_percent(double x) noexcept { return x * 100.0; }

/// @return Hypothèses construites à partir des valeurs par défaut.
vw::model::Assumptions default_assumptions();

/// @brief Message de contrôle d’une hypothèse.
struct InputIssue {
  std::string message;
  bool blocking{false}; ///< true si la valorisation ne peut pas aboutir.
};

/// @brief Contrôle les hypothèses contre les bornes.
std::vector<InputIssue> check_assumptions(const vw::model::Assumptions& a,
                                          const InputBounds& bounds = default_bounds());

/// @return true si au moins un message est bloquant.
bool has_blocking_issue(const std::vector<InputIssue>& issues) noexcept;

} // namespace config
} // namespace vw
