#pragma once
#include <cstddef>
#include <vector>

#include <bw/config/pricing_config.hpp>
#include <bw/market/bond.hpp>

namespace bw::schedule {

// Échéancier des flux d'une obligation.
// times[i] = (i+1)/f ; amounts[i] = coupon, + nominal sur le dernier flux.
struct CashFlowSchedule {
  std::vector<double> times;
  std::vector<double> amounts;

  std::size_t size() const noexcept { return times.size(); }
  bool empty() const noexcept { return times.empty(); }
};

// Nombre de paiements selon la politique (cf. pricing_config.hpp).
// Lève InvalidBondError si le résultat est nul, ou en mode Strict si
// tenor*frequency n'est pas entier à la tolérance près.
std::size_t payment_count(const bw::market::Bond& bond,
                          bw::config::PeriodCountPolicy policy = bw::config::PeriodCountPolicy::Snap,
                          double tolerance = 1e-9);

CashFlowSchedule build_schedule(const bw::market::Bond& bond,
                                bw::config::PeriodCountPolicy policy = bw::config::PeriodCountPolicy::Snap,
                                double tolerance = 1e-9);

// Raccourci : politique et tolérance lues dans la config.
CashFlowSchedule build_schedule(const bw::market::Bond& bond,
                                const bw::config::PricingConfig& cfg);

} // namespace bw::schedule
