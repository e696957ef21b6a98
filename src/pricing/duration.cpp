#include <bw/pricing/duration.hpp>

#include <bw/core/errors.hpp>
#include <bw/core/rounding.hpp>
#include <bw/pricing/bond_pricer.hpp>
#include <bw/schedule/cashflow_schedule.hpp>

#include <cmath> // std::exp, std::pow

namespace bw {
namespace pricing {

namespace {

using bw::config::DurationConvention;

// Macaulay en pleine précision (aucun arrondi ici).
double macaulay_raw(const bw::market::Bond& bond,
                    double y,
                    const bw::config::PricingConfig& cfg) {
  const double price = price_from_yield(bond, y, cfg); // valide aussi 1 + y/f > 0
  if (!(price > 0.0)) {
    throw DomainError("macaulay_duration: non-positive price");
  }

  const auto sched = bw::schedule::build_schedule(bond, cfg);
  const double f = static_cast<double>(bond.frequency);

  double num = 0.0;
  for (std::size_t i = 0; i < sched.size(); ++i) {
    const double t = sched.times[i];
    const double decay = (cfg.duration_convention == DurationConvention::Periodic)
                           ? std::pow(1.0 + y / f, -t * f)
                           : std::exp(-y * t);
    num += t * decay * sched.amounts[i];
  }
  return num / price;
}

// Modifiée à partir d'une Macaulay pleine précision `mac`.
double modified_from(double mac,
                     const bw::market::Bond& bond,
                     double y,
                     const bw::config::PricingConfig& cfg) {
  const double f = static_cast<double>(bond.frequency);
  const double base = cfg.modified_from_rounded ? bw::core::round_to(mac, cfg.decimals) : mac;
  return bw::core::round_to(base / (1.0 + y / f), cfg.decimals);
}

} // unnamed namespace

double macaulay_duration(const bw::market::Bond& bond,
                         double compounded_yield,
                         const bw::config::PricingConfig& cfg) {
  return bw::core::round_to(macaulay_raw(bond, compounded_yield, cfg), cfg.decimals);
}

double modified_duration(const bw::market::Bond& bond,
                         double compounded_yield,
                         const bw::config::PricingConfig& cfg) {
  return modified_from(macaulay_raw(bond, compounded_yield, cfg), bond, compounded_yield, cfg);
}

BondStatistics bond_statistics(const bw::market::Bond& bond,
                               double compounded_yield,
                               const bw::config::PricingConfig& cfg) {
  const double price = price_from_yield(bond, compounded_yield, cfg);
  const double mac   = macaulay_raw(bond, compounded_yield, cfg);

  BondStatistics out{};
  out.price    = bw::core::round_to(price, cfg.decimals);
  out.macaulay = bw::core::round_to(mac, cfg.decimals);
  out.modified = modified_from(mac, bond, compounded_yield, cfg);
  return out;
}

} // namespace pricing
} // namespace bw
