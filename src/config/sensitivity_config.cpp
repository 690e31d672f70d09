#include <vw/config/sensitivity_config.hpp>
#include <vw/sensitivity/sensitivity_grid.hpp> // linspace

namespace vw {
namespace config {

std::vector<double> SensitivityConfig::rate_axis() const {
  return vw::sensitivity::linspace(wacc_min, wacc_max, n_wacc);
}

std::vector<double> SensitivityConfig::growth_axis() const {
  return vw::sensitivity::linspace(tg_min, tg_max, n_tg);
}

} // namespace config
} // namespace vw
