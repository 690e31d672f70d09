#include <vw/model/assumptions.hpp>
#include <vw/config/input_bounds.hpp>
#include <vw/config/sensitivity_config.hpp>
#include <vw/io/assumptions_csv.hpp>
#include <vw/sensitivity/sensitivity_grid.hpp>

#include <chrono>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " [revenue g1 g2 g3 g4 g5 ebit_margin tax wacc tg]"
            << " [--fcf-conv VAL] [--csv FILE]"
            << " [--wacc-min VAL] [--wacc-max VAL] [--n-wacc N]"
            << " [--tg-min VAL] [--tg-max VAL] [--n-tg N]"
            << " [--threads N]\n";
}

int main(int argc, char** argv) {
  int first_flag = 1;
  while (first_flag < argc && std::string(argv[first_flag]).rfind("--", 0) != 0) ++first_flag;
  const int n_pos = first_flag - 1;
  if (n_pos != 0 && n_pos != 10) { usage(argv[0]); return 1; }

  std::vector<double> pos;
  vw::config::SensitivityConfig cfg; // plages du tableau de bord
  double fcf_conv = vw::model::kDefaultFcfConversion;
  bool has_fcf_conv = false;
  std::string csv_path;
  try {
    for (int i = 1; i < first_flag; ++i) pos.push_back(std::stod(argv[i]));
    for (int i = first_flag; i < argc; ++i) {
      std::string a = argv[i];
      if      (a=="--fcf-conv" && i+1<argc) { fcf_conv = std::stod(argv[++i]); has_fcf_conv = true; }
      else if (a=="--csv" && i+1<argc)      csv_path = argv[++i];
      else if (a=="--wacc-min" && i+1<argc) cfg.wacc_min = std::stod(argv[++i]);
      else if (a=="--wacc-max" && i+1<argc) cfg.wacc_max = std::stod(argv[++i]);
      else if (a=="--n-wacc" && i+1<argc)   cfg.n_wacc = static_cast<std::size_t>(std::stoull(argv[++i]));
      else if (a=="--tg-min" && i+1<argc)   cfg.tg_min = std::stod(argv[++i]);
      else if (a=="--tg-max" && i+1<argc)   cfg.tg_max = std::stod(argv[++i]);
      else if (a=="--n-tg" && i+1<argc)     cfg.n_tg = static_cast<std::size_t>(std::stoull(argv[++i]));
      else if (a=="--threads" && i+1<argc)  cfg.n_threads = static_cast<std::size_t>(std::stoull(argv[++i]));
      else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
    }
  } catch (const std::exception&) { usage(argv[0]); return 1; }

  if (cfg.n_wacc == 0 || cfg.n_tg == 0) {
    std::cerr << "--n-wacc et --n-tg doivent être >= 1\n"; usage(argv[0]); return 1;
  }
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
    const vw::model::Assumptions a = has_fcf_conv
        ? vw::model::Assumptions(base.current_revenue, base.growth_rates, base.ebit_margin,
                                 base.tax_rate, base.wacc, base.terminal_growth, fcf_conv)
        : base;

    const auto t0 = std::chrono::steady_clock::now();
    const auto grid = vw::sensitivity::sensitivity_grid(a, cfg);
    const double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();

    std::cout.setf(std::ios::fixed);
    std::cout << "Enterprise value ($M), rows = terminal growth, cols = WACC\n";
    std::cout << std::setprecision(2);
    std::cout << std::setw(10) << "g \\ wacc";
    for (double r : grid.rate_axis) std::cout << std::setw(11) << vw::config::to_percent(r) << "%";
    std::cout << "\n";
    for (std::size_t i = 0; i < grid.rows(); ++i) {
      std::cout << std::setw(9) << vw::config::to_percent(grid.growth_axis[i]) << "%";
      for (std::size_t j = 0; j < grid.cols(); ++j) {
        if (grid.is_feasible(i, j)) std::cout << std::setw(12) << grid.at(i, j);
        else                        std::cout << std::setw(12) << "n/a";
      }
      std::cout << "\n";
    }
    std::cout << "infeasible cells: " << grid.infeasible_count()
              << " / " << grid.rows() * grid.cols() << "\n";
    std::cout << "threads         : " << (cfg.n_threads == 0 ? 1 : cfg.n_threads) << "\n";
    std::cout << "elapsed_ms      : " << elapsed_ms << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 2;
  }
  return 0;
}
