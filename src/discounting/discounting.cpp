#include <vw/discounting/discounting.hpp>

#include <cmath>     // std::pow, std::isfinite
#include <limits>    // quiet_NaN
#include <stdexcept> // std::invalid_argument

namespace vw {
namespace discounting {

std::string to_string(TvStatus s) {
  switch (s) {
    case TvStatus::Ok:                 return "ok";
    case TvStatus::RateNotAboveGrowth: return "discount rate <= terminal growth";
    case TvStatus::NonFinite:          return "non-finite terminal value";
  }
  return "unknown";
}

std::vector<double> discount_factors(double rate, std::size_t n) {
  std::vector<double> df;
  df.reserve(n);
  for (std::size_t y = 1; y <= n; ++y) {
    df.push_back(1.0 / std::pow(1.0 + rate, static_cast<double>(y)));
  }
  return df;
}

std::vector<double> present_values(const std::vector<double>& cashflows,
                                   const std::vector<double>& factors) {
  if (cashflows.size() != factors.size()) {
    throw std::invalid_argument("present_values: cashflows and factors differ in length");
  }
  std::vector<double> pv;
  pv.reserve(cashflows.size());
  for (std::size_t i = 0; i < cashflows.size(); ++i) {
    pv.push_back(cashflows[i] * factors[i]);
  }
  return pv;
}

TerminalValueResult terminal_value(double final_fcf,
                                   double terminal_growth,
                                   double rate) noexcept {
  constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

  if (!(std::isfinite(final_fcf) && std::isfinite(terminal_growth) && std::isfinite(rate))) {
    return {NaN, TvStatus::NonFinite};
  }
  // rate == g ⇒ division par zéro ; rate < g ⇒ signe inversé
  if (rate <= terminal_growth) {
    return {NaN, TvStatus::RateNotAboveGrowth};
  }

  const double tv = final_fcf * (1.0 + terminal_growth) / (rate - terminal_growth);
  if (!std::isfinite(tv)) {
    return {NaN, TvStatus::NonFinite};
  }
  return {tv, TvStatus::Ok};
}

double pv_terminal_value(double tv, double final_discount_factor) noexcept {
  return tv * final_discount_factor;
}

} // namespace discounting
} // namespace vw
