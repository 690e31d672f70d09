#include <vw/config/input_bounds.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace {

using vw::config::InputBound;
using vw::config::InputIssue;

// Vérifie une valeur (en unité de saisie) contre sa borne.
void check_range(std::vector<InputIssue>& out, const InputBound& b, double value_in_input_unit) {
  if (!std::isfinite(value_in_input_unit)) {
    out.push_back({std::string(b.label) + ": value is not finite", true});
    return;
  }
  constexpr double slack = 1e-9; // arrondi de la conversion décimal → pourcent
  if (value_in_input_unit < b.min - slack || value_in_input_unit > b.max + slack) {
    std::ostringstream os;
    os << b.label << ": " << value_in_input_unit << " outside [" << b.min << ", " << b.max << "]";
    out.push_back({os.str(), false});
  }
}

} // namespace

namespace vw {
namespace config {

const InputBounds& default_bounds() noexcept {
  static const InputBounds B{
    {"Current Annual Revenue ($M)", 1.0, 10000.0, 100.0, 5.0},
    {{
      {"Year 1 Growth Rate", 0.0, 30.0, 15.0, 0.5},
      {"Year 2 Growth Rate", 0.0, 30.0, 12.0, 0.5},
      {"Year 3 Growth Rate", 0.0, 30.0, 10.0, 0.5},
      {"Year 4 Growth Rate", 0.0, 30.0,  8.0, 0.5},
      {"Year 5 Growth Rate", 0.0, 30.0,  6.0, 0.5},
    }},
    {"Target EBIT Margin",     10.0, 40.0,  20.0, 1.0},
    {"Tax Rate",               15.0, 35.0,  25.0, 1.0},
    {"WACC",                    5.0, 15.0,  10.0, 0.5},
    {"Terminal Growth Rate",    1.0,  5.0,   3.0, 0.25},
    {"FCF Conversion Rate",    60.0, 100.0, 80.0, 5.0},
  };
  return B;
}

vw::model::Assumptions default_assumptions() {
  const InputBounds& b = default_bounds();
  std::vector<double> growth;
  growth.reserve(b.growth.size());
  for (const auto& g : b.growth) growth.push_back(from_percent(g.default_value));

  return vw::model::Assumptions(b.current_revenue.default_value,
                                std::move(growth),
                                from_percent(b.ebit_margin.default_value),
                                from_percent(b.tax_rate.default_value),
                                from_percent(b.wacc.default_value),
                                from_percent(b.terminal_growth.default_value),
                                from_percent(b.fcf_conversion.default_value));
}

std::vector<InputIssue> check_assumptions(const vw::model::Assumptions& a,
                                          const InputBounds& bounds) {
  std::vector<InputIssue> out;

  check_range(out, bounds.current_revenue, a.current_revenue);
  for (std::size_t i = 0; i < bounds.growth.size() && i < a.growth_rates.size(); ++i) {
    check_range(out, bounds.growth[i], to_percent(a.growth_rates[i]));
  }
  check_range(out, bounds.ebit_margin,     to_percent(a.ebit_margin));
  check_range(out, bounds.tax_rate,        to_percent(a.tax_rate));
  check_range(out, bounds.wacc,            to_percent(a.wacc));
  check_range(out, bounds.terminal_growth, to_percent(a.terminal_growth));
  check_range(out, bounds.fcf_conversion,  to_percent(a.fcf_conversion));

  if (!(a.current_revenue > 0.0)) {
    out.push_back({"Current revenue must be > 0", true});
  }
  if (!(a.tax_rate >= 0.0 && a.tax_rate < 1.0)) {
    out.push_back({"Tax rate must lie in [0, 1)", true});
  }
  if (!(a.wacc > a.terminal_growth)) {
    std::ostringstream os;
    os << "WACC (" << to_percent(a.wacc) << "%) must be greater than terminal growth ("
       << to_percent(a.terminal_growth) << "%)";
    out.push_back({os.str(), true});
  }
  return out;
}

bool has_blocking_issue(const std::vector<InputIssue>& issues) noexcept {
  return std::any_of(issues.begin(), issues.end(),
                     [](const InputIssue& i) { return i.blocking; });
}

} // namespace config
} // namespace vw
