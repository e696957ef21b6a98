#include <bw/pricing/bond_pricer.hpp>

#include <bw/core/errors.hpp>
#include <bw/core/rounding.hpp>
#include <bw/rates/discount.hpp>
#include <bw/schedule/cashflow_schedule.hpp>

#include <cmath>   // std::pow
#include <string>

namespace bw {
namespace pricing {

double price_from_curve(const bw::market::Bond& bond,
                        const std::vector<double>& zero_rates,
                        const bw::config::PricingConfig& cfg) {
  const auto sched = bw::schedule::build_schedule(bond, cfg);
  if (zero_rates.size() != sched.size()) {
    throw LengthMismatchError("price_from_curve: curve has " + std::to_string(zero_rates.size())
                              + " rates, bond has " + std::to_string(sched.size()) + " payments");
  }

  double pv = 0.0;
  for (std::size_t i = 0; i < sched.size(); ++i) {
    const double df = bw::rates::discount_factor(1.0, sched.times[i], zero_rates[i]);
    pv += sched.amounts[i] * df;
  }
  return bw::core::round_to(pv, cfg.decimals);
}

double price_from_yield(const bw::market::Bond& bond,
                        double compounded_yield,
                        const bw::config::PricingConfig& cfg) {
  const double f = static_cast<double>(bond.frequency);
  const double base = 1.0 + compounded_yield / f;
  if (!(base > 0.0)) {
    throw DomainError("price_from_yield: 1 + yield / frequency must be > 0");
  }

  const auto sched = bw::schedule::build_schedule(bond, cfg);
  double pv = 0.0;
  for (std::size_t i = 0; i < sched.size(); ++i) {
    pv += sched.amounts[i] * std::pow(base, -sched.times[i] * f);
  }
  return pv; // pas d'arrondi : réutilisé par la duration
}

} // namespace pricing
} // namespace bw
