#include "bw/schedule/cashflow_schedule.hpp"
#include "bw/core/errors.hpp"

#include <cmath>
#include <sstream>

namespace bw::schedule {

using bw::config::PeriodCountPolicy;

namespace {
// borne du nombre de paiements (100 ans de paiements quotidiens ~ 36 500)
constexpr double MAX_PERIODS = 1e7;
} // namespace

std::size_t payment_count(const bw::market::Bond& bond, PeriodCountPolicy policy, double tolerance) {
  const double x = bond.tenor * static_cast<double>(bond.frequency);
  if (!std::isfinite(x) || x > MAX_PERIODS) {
    std::ostringstream os;
    os << "build_schedule: tenor * frequency = " << x << " exceeds " << MAX_PERIODS << " periods";
    throw InvalidBondError(os.str());
  }
  const double nearest = std::round(x);
  const bool on_grid = std::fabs(x - nearest) <= tolerance;

  double n = std::trunc(x);
  switch (policy) {
    case PeriodCountPolicy::Truncate:
      break;
    case PeriodCountPolicy::Snap:
      if (on_grid) n = nearest;
      break;
    case PeriodCountPolicy::Strict:
      if (!on_grid) {
        std::ostringstream os;
        os << "build_schedule: tenor * frequency = " << x << " is not an integer number of periods";
        throw InvalidBondError(os.str());
      }
      n = nearest;
      break;
  }

  if (n < 1.0) {
    throw InvalidBondError("build_schedule: bond has no payment period (tenor * frequency < 1)");
  }
  return static_cast<std::size_t>(n);
}

CashFlowSchedule build_schedule(const bw::market::Bond& bond, PeriodCountPolicy policy, double tolerance) {
  const std::size_t n = payment_count(bond, policy, tolerance);
  const double f = static_cast<double>(bond.frequency);
  const double cpn = bond.coupon_amount();

  CashFlowSchedule out;
  out.times.reserve(n);
  out.amounts.assign(n, cpn);
  for (std::size_t i = 0; i < n; ++i) {
    out.times.push_back(static_cast<double>(i + 1) / f);
  }
  // remboursement du nominal avec le dernier coupon
  out.amounts.back() += bond.face;
  return out;
}

CashFlowSchedule build_schedule(const bw::market::Bond& bond, const bw::config::PricingConfig& cfg) {
  return build_schedule(bond, cfg.count_policy, cfg.count_tolerance);
}

} // namespace bw::schedule
