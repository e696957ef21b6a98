#pragma once
#include <vector>

#include <bw/config/pricing_config.hpp>
#include <bw/config/sweep_config.hpp>
#include <bw/market/bond.hpp>

namespace bw::analytics {

struct SweepPoint {
  double yield{0.0};
  double price{0.0};    // arrondi à cfg.decimals
  double macaulay{0.0};
  double modified{0.0};
};

// Évalue bond_statistics sur une grille de rendements (courbes prix/rendement,
// duration/rendement). Lève std::invalid_argument si n_points == 0 ou y_max < y_min.
std::vector<SweepPoint>
yield_sweep(const bw::market::Bond& bond,
            const bw::config::SweepConfig& sweep,
            const bw::config::PricingConfig& cfg = bw::config::PricingConfig{});

} // namespace bw::analytics
