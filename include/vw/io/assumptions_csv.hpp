#pragma once
#include <string>
#include <vector>

#include <vw/model/assumptions.hpp>

namespace vw::io {

// Lit un fichier d’hypothèses "clé,valeur" (une hypothèse par ligne, '#' = commentaire).
// Clés : current_revenue, growth_1..growth_5, ebit_margin, tax_rate, wacc,
//        terminal_growth, fcf_conversion (optionnelle, 0.8 par défaut).
// Synonymes acceptés (revenue, g1, margin, tax, discount_rate, tg, conversion…).
// Valeurs en décimal ; un suffixe '%' divise par 100 ("12.5%" -> 0.125).
// Clés inconnues / valeurs illisibles -> warnings (ligne ignorée).
// Fichier illisible ou clé obligatoire absente -> std::runtime_error.
vw::model::Assumptions
read_assumptions_csv(const std::string& path,
                     std::vector<std::string>* warnings = nullptr);

} // namespace vw::io
