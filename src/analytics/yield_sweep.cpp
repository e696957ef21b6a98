#include "bw/analytics/yield_sweep.hpp"
#include "bw/pricing/duration.hpp"

#include <cmath>
#include <stdexcept>

namespace bw::analytics {

std::vector<SweepPoint>
yield_sweep(const bw::market::Bond& bond,
            const bw::config::SweepConfig& sweep,
            const bw::config::PricingConfig& cfg)
{
  if (sweep.n_points == 0) {
    throw std::invalid_argument("yield_sweep: n_points must be >= 1");
  }
  if (!std::isfinite(sweep.y_min) || !std::isfinite(sweep.y_max) || sweep.y_max < sweep.y_min) {
    throw std::invalid_argument("yield_sweep: need finite y_min <= y_max");
  }

  std::vector<SweepPoint> out;
  out.reserve(sweep.n_points);
  const double step = (sweep.n_points == 1)
                      ? 0.0
                      : (sweep.y_max - sweep.y_min) / static_cast<double>(sweep.n_points - 1);

  for (std::size_t i = 0; i < sweep.n_points; ++i) {
    // dernier point forcé à y_max (pas d'erreur d'accumulation)
    const double y = (i + 1 == sweep.n_points && sweep.n_points > 1)
                     ? sweep.y_max
                     : sweep.y_min + step * static_cast<double>(i);
    const auto st = bw::pricing::bond_statistics(bond, y, cfg);
    out.push_back({y, st.price, st.macaulay, st.modified});
  }
  return out;
}

} // namespace bw::analytics
