#include <vw/model/assumptions.hpp>
#include <vw/config/input_bounds.hpp>
#include <vw/io/assumptions_csv.hpp>
#include <vw/valuation/valuation.hpp>
#include <vw/valuation/insights.hpp>
#include <vw/sensitivity/wacc_sensitivity.hpp>

#include <iostream>
#include <iomanip>
#include <optional>
#include <string>
#include <vector>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " [revenue g1 g2 g3 g4 g5 ebit_margin tax wacc tg]"
            << " [--fcf-conv VAL]"
            << " [--csv FILE]"
            << " [--bump VAL]\n"
            << "  (taux en décimal ; sans positionnels : cas par défaut)\n";
}

static void print_row(const char* label, const std::vector<double>& v) {
  std::cout << std::left << std::setw(12) << label << std::right;
  for (double x : v) std::cout << std::setw(12) << x;
  std::cout << "\n";
}

int main(int argc, char** argv) {
  // Positionnels (0 ou 10)
  int first_flag = 1;
  while (first_flag < argc && std::string(argv[first_flag]).rfind("--", 0) != 0) ++first_flag;
  const int n_pos = first_flag - 1;
  if (n_pos != 0 && n_pos != 10) { usage(argv[0]); return 1; }

  std::vector<double> pos;
  try {
    for (int i = 1; i < first_flag; ++i) pos.push_back(std::stod(argv[i]));
  } catch (const std::exception&) { usage(argv[0]); return 1; }

  // Flags
  std::optional<double> fcf_conv;
  std::string csv_path;
  double bump = 0.01;
  try {
    for (int i = first_flag; i < argc; ++i) {
      std::string a = argv[i];
      if      (a=="--fcf-conv" && i+1<argc) fcf_conv = std::stod(argv[++i]);
      else if (a=="--csv" && i+1<argc)      csv_path = argv[++i];
      else if (a=="--bump" && i+1<argc)     bump = std::stod(argv[++i]);
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception&) { usage(argv[0]); return 1; }

  if (!csv_path.empty() && n_pos != 0) {
    std::cerr << "--csv et positionnels sont exclusifs\n"; usage(argv[0]); return 1;
  }

  try {
    const vw::model::Assumptions base = [&]() {
      if (!csv_path.empty()) {
        std::vector<std::string> warnings;
        auto a = vw::io::read_assumptions_csv(csv_path, &warnings);
        for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
        return a;
      }
      if (n_pos == 10) {
        return vw::model::Assumptions(pos[0], {pos[1], pos[2], pos[3], pos[4], pos[5]},
                                      pos[6], pos[7], pos[8], pos[9]);
      }
      return vw::config::default_assumptions();
    }();

    const vw::model::Assumptions a = fcf_conv
        ? vw::model::Assumptions(base.current_revenue, base.growth_rates, base.ebit_margin,
                                 base.tax_rate, base.wacc, base.terminal_growth, *fcf_conv)
        : base;

    const auto issues = vw::config::check_assumptions(a);
    for (const auto& is : issues) {
      if (!is.blocking) std::cerr << "[warn] " << is.message << "\n";
    }
    if (vw::config::has_blocking_issue(issues)) {
      for (const auto& is : issues) {
        if (is.blocking) std::cerr << "Error: " << is.message << "\n";
      }
      return 2;
    }

    const auto res = vw::valuation::run_valuation(a);
    const auto ins = vw::valuation::compute_insights(a, res);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(2);

    // Projection (année 0 = CA courant)
    std::cout << "== Projection ($M) ==\n";
    std::cout << std::left << std::setw(12) << "Year" << std::right;
    for (std::size_t y = 0; y <= res.revenues.size(); ++y) std::cout << std::setw(12) << y;
    std::cout << "\n";
    std::vector<double> rev{a.current_revenue};
    rev.insert(rev.end(), res.revenues.begin(), res.revenues.end());
    print_row("Revenue", rev);
    std::cout << std::left << std::setw(12) << "EBIT" << std::right << std::setw(12) << "";
    for (double x : res.ebits) std::cout << std::setw(12) << x;
    std::cout << "\n" << std::left << std::setw(12) << "NOPAT" << std::right << std::setw(12) << "";
    for (double x : res.nopats) std::cout << std::setw(12) << x;
    std::cout << "\n" << std::left << std::setw(12) << "FCF" << std::right << std::setw(12) << "";
    for (double x : res.fcfs) std::cout << std::setw(12) << x;
    std::cout << "\n\n";

    std::cout << "== Discounting ==\n";
    std::cout << std::left << std::setw(12) << "Year" << std::right;
    for (std::size_t y = 1; y <= res.fcfs.size(); ++y) std::cout << std::setw(12) << y;
    std::cout << "\n";
    print_row("FCF", res.fcfs);
    std::cout << std::setprecision(4);
    print_row("DF", res.discount_factors);
    std::cout << std::setprecision(2);
    print_row("PV(FCF)", res.pv_fcfs);
    std::cout << "\n";

    std::cout << "== Summary ==\n"
              << "wacc              : " << vw::config::to_percent(a.wacc) << " %\n"
              << "terminal_growth   : " << vw::config::to_percent(a.terminal_growth) << " %\n"
              << "pv_forecast_period: " << res.pv_forecast_period << "\n"
              << "terminal_value    : " << res.terminal_value << "\n"
              << "pv_terminal_value : " << res.pv_terminal_value << "\n"
              << "enterprise_value  : " << res.enterprise_value << "\n\n";

    std::cout << "== Insights ==\n"
              << "EV / revenue      : " << ins.revenue_multiple << "x\n"
              << "EV / Y5 revenue   : " << ins.ev_to_final_revenue << "x\n"
              << "EV / EBITDA (est.): " << ins.ebitda_multiple_est << "x\n"
              << "terminal share    : " << vw::config::to_percent(ins.terminal_share) << " %\n"
              << "forecast share    : " << vw::config::to_percent(ins.forecast_share) << " %\n"
              << "revenue CAGR      : " << vw::config::to_percent(ins.revenue_cagr) << " %\n"
              << "wacc - tg spread  : " << vw::config::to_percent(ins.wacc_tg_spread) << " pts\n";
    if (ins.high_terminal_dependency)
      std::cerr << "[warn] terminal value above 75% of EV: valuation driven by long-term assumptions\n";
    if (ins.narrow_spread)
      std::cerr << "[warn] WACC - terminal growth spread below 3 pts: results highly sensitive\n";

    // Sensibilité ±bump : un échec ici n’invalide pas le cas de base
    std::cout << "\n== WACC sensitivity ==\n";
    try {
      const auto ws = vw::sensitivity::wacc_sensitivity(a, bump);
      std::cout << "bump              : " << vw::config::to_percent(ws.bump) << " pts\n"
                << "ev_minus          : " << ws.ev_minus << "\n"
                << "ev_plus           : " << ws.ev_plus << "\n";
      std::cout << std::setprecision(4);
      std::cout << "sensitivity       : " << ws.sensitivity << "\n";
    } catch (const vw::valuation::ValuationError& e) {
      std::cerr << "[warn] WACC sensitivity unavailable: " << e.what() << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 2;
  }
  return 0;
}
