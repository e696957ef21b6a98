#include "bw/schedule/cashflow_schedule.hpp"
#include "bw/core/errors.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <limits>

template <class E, class F>
static bool throws(F f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  using bw::market::Bond;
  using bw::config::PeriodCountPolicy;
  using bw::schedule::build_schedule;
  using bw::schedule::payment_count;
  constexpr double EPS = 1e-12;

  // 1) Annuel, 2 ans : 6 puis 106
  {
    const auto s = build_schedule(Bond(100.0, 2.0, 0.06, 1));
    assert(s.size() == 2);
    assert(s.times.size() == s.amounts.size());
    assert(std::abs(s.times[0] - 1.0) < EPS && std::abs(s.times[1] - 2.0) < EPS);
    assert(std::abs(s.amounts[0] - 6.0) < EPS);
    assert(std::abs(s.amounts[1] - 106.0) < EPS);
  }

  // 2) Semestriel, 5 ans : 10 flux, dates croissantes jusqu'à 5
  {
    const Bond b(100.0, 5.0, 0.05, 2);
    const auto s = build_schedule(b);
    assert(s.size() == 10);
    for (std::size_t i = 1; i < s.size(); ++i) assert(s.times[i] > s.times[i-1]);
    assert(std::abs(s.times.back() - 5.0) < EPS);
    for (std::size_t i = 0; i + 1 < s.size(); ++i) assert(std::abs(s.amounts[i] - 2.5) < EPS);
    assert(std::abs(s.amounts.back() - (2.5 + 100.0)) < EPS);
    assert(s.amounts.back() >= b.face);
  }

  // 3) Zéro-coupon : un seul flux = nominal
  {
    const auto s = build_schedule(Bond(100.0, 3.0, 0.0, 1));
    assert(s.size() == 3);
    assert(s.amounts[0] == 0.0 && s.amounts[1] == 0.0);
    assert(s.amounts[2] == 100.0);
  }

  // 4) Erreur d'arrondi flottant : 0.29 * 100 = 28.999999999999996
  {
    const Bond b(100.0, 0.29, 0.05, 100);
    assert(payment_count(b, PeriodCountPolicy::Truncate) == 28);
    assert(payment_count(b, PeriodCountPolicy::Snap) == 29);
    assert(payment_count(b, PeriodCountPolicy::Strict) == 29);
    assert(build_schedule(b).size() == 29);
  }

  // 5) Maturité réellement fractionnaire : troncature (Snap) ou erreur (Strict)
  {
    const Bond b(100.0, 1.25, 0.05, 1);
    assert(payment_count(b, PeriodCountPolicy::Truncate) == 1);
    assert(payment_count(b, PeriodCountPolicy::Snap) == 1);
    assert(throws<bw::InvalidBondError>([&]{ (void)payment_count(b, PeriodCountPolicy::Strict); }));
    const auto s = build_schedule(b);
    assert(s.times.back() < b.tenor);
  }

  // 6) Aucun paiement
  assert(throws<bw::InvalidBondError>([]{ (void)build_schedule(Bond(100.0, 0.25, 0.05, 2)); }));

  // 7) Obligations invalides
  assert(throws<bw::InvalidBondError>([]{ Bond(0.0, 1.0, 0.05, 1); }));
  assert(throws<bw::InvalidBondError>([]{ Bond(100.0, -1.0, 0.05, 1); }));
  assert(throws<bw::InvalidBondError>([]{ Bond(100.0, 1.0, -0.01, 1); }));
  assert(throws<bw::InvalidBondError>([]{ Bond(100.0, 1.0, 0.05, 0); }));
  assert(throws<std::invalid_argument>([]{ Bond(std::numeric_limits<double>::quiet_NaN(), 1.0, 0.05, 1); }));
  const double inf = std::numeric_limits<double>::infinity();
  assert(throws<bw::InvalidBondError>([&]{ Bond(100.0, inf, 0.05, 1); }));
  assert(throws<bw::InvalidBondError>([&]{ Bond(inf, 1.0, 0.05, 1); }));

  // 8) Maturité finie mais démesurée : refusée avant tout calcul d'échéancier
  {
    const Bond huge(100.0, 1e300, 0.05, 1);
    assert(throws<bw::InvalidBondError>([&]{ (void)bw::schedule::payment_count(huge); }));
    assert(throws<bw::InvalidBondError>([&]{ (void)bw::schedule::build_schedule(huge); }));
    const Bond daily(100.0, 100.0, 0.05, 365);
    assert(bw::schedule::payment_count(daily) == 36500u);
  }

  std::cout << "Schedule OK.\n";
  return 0;
}
