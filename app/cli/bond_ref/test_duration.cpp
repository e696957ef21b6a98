#include "bw/pricing/duration.hpp"
#include "bw/pricing/bond_pricer.hpp"
#include "bw/core/errors.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <vector>

int main() {
  using bw::market::Bond;
  using namespace bw::pricing;
  constexpr double EPS = 1e-12;

  // 1) Valeurs de référence (convention mixte par défaut)
  {
    const Bond b(100.0, 5.0, 0.05, 2);
    assert(std::abs(macaulay_duration(b, 0.04) - 4.4904) < EPS);
    // Macaulay arrondie / 1.02 : 4.4904 / 1.02 = 4.40235... ⇒ 4.4024
    assert(std::abs(modified_duration(b, 0.04) - 4.4024) < EPS);

    const auto st = bond_statistics(b, 0.04);
    assert(std::abs(st.price    - 104.4913) < EPS);
    assert(std::abs(st.macaulay - 4.4904)   < EPS);
    assert(std::abs(st.modified - 4.4024)   < EPS);

    // Variante pleine précision : 4.49040.../1.02 = 4.40234... ⇒ 4.4023
    const bw::config::PricingConfig full(bw::config::PeriodCountPolicy::Snap, 1e-9,
                                         bw::config::DurationConvention::Reference, 4, false);
    assert(std::abs(modified_duration(b, 0.04, full) - 4.4023) < EPS);
    assert(std::abs(bond_statistics(b, 0.04, full).modified - 4.4023) < EPS);
    assert(std::abs(bond_statistics(b, 0.04, full).macaulay - 4.4904) < EPS);
  }
  {
    const Bond b(100.0, 10.0, 0.06, 1);
    assert(std::abs(macaulay_duration(b, 0.05) - 7.8059) < EPS);
    assert(std::abs(modified_duration(b, 0.05) - 7.4342) < EPS);
  }
  {
    const Bond b(1000.0, 2.0, 0.08, 4);
    const auto st = bond_statistics(b, 0.06);
    assert(std::abs(st.price    - 1037.4296) < EPS);
    assert(std::abs(st.macaulay - 1.8693)    < EPS);
    assert(std::abs(st.modified - 1.8417)    < EPS);
  }

  // 2) Bornes : Macaulay <= maturité, modifiée < Macaulay si y > 0
  for (double cpn : {0.01, 0.05, 0.10}) {
    for (int f : {1, 2, 4}) {
      for (double y : {0.005, 0.03, 0.08, 0.15}) {
        const Bond b(100.0, 7.0, cpn, f);
        const double mac = macaulay_duration(b, y);
        const double mod = modified_duration(b, y);
        assert(mac <= b.tenor);
        assert(mod < mac);
      }
    }
  }

  // 3) Zéro-coupon : tout le poids sur le dernier flux
  {
    const Bond z(100.0, 3.0, 0.0, 1);
    bw::config::PricingConfig periodic;
    periodic.duration_convention = bw::config::DurationConvention::Periodic;
    assert(std::abs(macaulay_duration(z, 0.05, periodic) - 3.0) < EPS);
    assert(std::abs(macaulay_duration(z, 0.0) - 3.0) < EPS);
    // convention mixte : exp(-yT) < (1+y)^-T ⇒ légèrement sous la maturité
    assert(std::abs(macaulay_duration(z, 0.05) - 2.9891) < EPS);
    assert(std::abs(modified_duration(z, 0.05, periodic) - 2.8571) < EPS);
  }

  // 4) Convention périodique sur une obligation à coupons
  {
    const Bond b(100.0, 5.0, 0.05, 2);
    bw::config::PricingConfig periodic;
    periodic.duration_convention = bw::config::DurationConvention::Periodic;
    assert(std::abs(macaulay_duration(b, 0.04, periodic) - 4.4989) < EPS);
    assert(std::abs(modified_duration(b, 0.04, periodic) - 4.4107) < EPS);
    // la pondération continue pèse moins que la périodique
    assert(macaulay_duration(b, 0.04) < macaulay_duration(b, 0.04, periodic));
  }

  // 5) Pleine précision
  {
    const Bond b(100.0, 5.0, 0.05, 2);
    bw::config::PricingConfig raw;
    raw.decimals = -1;
    assert(std::abs(macaulay_duration(b, 0.04, raw) - 4.490385465149846) < 1e-12);
    assert(std::abs(bond_statistics(b, 0.04, raw).price - price_from_yield(b, 0.04)) < EPS);
  }

  // 6) Les erreurs de domaine remontent
  {
    bool caught = false;
    try { (void)macaulay_duration(Bond(100.0, 5.0, 0.05, 2), -2.0); }
    catch (const bw::DomainError&) { caught = true; }
    assert(caught);
  }

  std::cout << "Duration OK.\n";
  return 0;
}
