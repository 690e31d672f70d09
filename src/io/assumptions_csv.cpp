#include "vw/io/assumptions_csv.hpp"
#include <fstream>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// parse double strict ("" ou reste non vide -> NaN), '%' final => /100
static double parse_value(std::string s) {
  s = trim(s);
  bool pct = false;
  if (!s.empty() && s.back()=='%') { pct = true; s.pop_back(); s = trim(s); }
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str() || *end != '\0') return std::numeric_limits<double>::quiet_NaN();
  return pct ? v / 100.0 : v;
}

// Champs canoniques ; growth_1..growth_5 occupent les index 1..5
enum Slot { REVENUE=0, G1, G2, G3, G4, G5, MARGIN, TAX, WACC, TG, CONV, N_SLOTS };

static const std::unordered_map<std::string,int>& synonyms() {
  static const std::unordered_map<std::string,int> m = {
    {"current_revenue", REVENUE}, {"revenue", REVENUE}, {"revenue_0", REVENUE},
    {"growth_1", G1}, {"g1", G1}, {"growth_year_1", G1},
    {"growth_2", G2}, {"g2", G2}, {"growth_year_2", G2},
    {"growth_3", G3}, {"g3", G3}, {"growth_year_3", G3},
    {"growth_4", G4}, {"g4", G4}, {"growth_year_4", G4},
    {"growth_5", G5}, {"g5", G5}, {"growth_year_5", G5},
    {"ebit_margin", MARGIN}, {"margin", MARGIN},
    {"tax_rate", TAX}, {"tax", TAX},
    {"wacc", WACC}, {"discount_rate", WACC},
    {"terminal_growth", TG}, {"tg", TG}, {"perpetual_growth", TG},
    {"fcf_conversion", CONV}, {"conversion", CONV},
  };
  return m;
}

static const char* slot_name(int s) {
  static const char* names[N_SLOTS] = {
    "current_revenue", "growth_1", "growth_2", "growth_3", "growth_4", "growth_5",
    "ebit_margin", "tax_rate", "wacc", "terminal_growth", "fcf_conversion"
  };
  return names[s];
}

} // namespace

namespace vw::io {

vw::model::Assumptions
read_assumptions_csv(const std::string& path, std::vector<std::string>* warnings)
{
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("read_assumptions_csv: impossible d'ouvrir le fichier: " + path);
  }

  std::optional<double> slots[N_SLOTS];
  auto warn = [&](const std::string& w){ if (warnings) warnings->push_back(w); };

  std::string line;
  int lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);
    const std::string key = lower(cells[0]);
    if (key=="key" || key=="field" || key=="name") continue; // en-tête facultatif

    if (cells.size() < 2) {
      warn("Ligne " + std::to_string(lineno) + " ignorée: valeur manquante");
      continue;
    }

    auto it = synonyms().find(key);
    if (it == synonyms().end()) {
      warn("Ligne " + std::to_string(lineno) + " ignorée: clé inconnue '" + cells[0] + "'");
      continue;
    }

    const double v = parse_value(cells[1]);
    if (!std::isfinite(v)) {
      warn("Ligne " + std::to_string(lineno) + " ignorée: valeur illisible pour " + slot_name(it->second));
      continue;
    }
    if (slots[it->second]) {
      warn(std::string("Clé dupliquée: ") + slot_name(it->second) + " (dernière valeur retenue)");
    }
    slots[it->second] = v;
  }

  for (int s = REVENUE; s < CONV; ++s) {
    if (!slots[s]) {
      throw std::runtime_error(std::string("read_assumptions_csv: clé obligatoire absente: ") + slot_name(s));
    }
  }

  std::vector<double> growth;
  for (int s = G1; s <= G5; ++s) growth.push_back(*slots[s]);

  return vw::model::Assumptions(*slots[REVENUE], std::move(growth),
                                *slots[MARGIN], *slots[TAX], *slots[WACC], *slots[TG],
                                slots[CONV].value_or(vw::model::kDefaultFcfConversion));
}

} // namespace vw::io
