#include "bw/rates/discount.hpp"
#include "bw/core/errors.hpp"
#include "bw/core/rounding.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <vector>
#include <algorithm>

// true si f() lève une exception de type E
template <class E, class F>
static bool throws(F f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  using namespace bw::rates;
  constexpr double EPS = 1e-12;

  // 1) Actualisation simple : face / (1 + r T)
  assert(std::abs(discount_factor(100.0, 2.0, 0.05) - 100.0 / 1.1) < EPS);
  assert(std::abs(discount_factor(1.0, 0.5, 0.04) - 1.0 / 1.02) < EPS);
  assert(discount_factor(1.0, 3.0, 0.0) == 1.0);
  // taux négatif autorisé tant que 1 + rT != 0
  assert(std::abs(discount_factor(1.0, 1.0, -0.01) - 1.0 / 0.99) < EPS);
  assert(throws<bw::DomainError>([]{ (void)discount_factor(1.0, 2.0, -0.5); }));

  // 2) PV d'un flux (arrondi 4 décimales)
  assert(std::abs(present_value(100.0, 0.04, 0.5) - 98.0392) < EPS);
  assert(std::abs(present_value(106.0, 0.055, 2.0) - 95.4955) < EPS);

  // 3) Conversions, valeurs de référence
  assert(std::abs(simple_to_compounded(0.05, 2.0, 2) - 0.04822737816889022) < 1e-14);
  assert(std::abs(compounded_to_simple(0.04, 1.0, 2) - 0.0404) < 1e-14);

  // 4) Aller-retour simple -> composé -> simple
  double devmax = 0.0;
  for (double r : {-0.02, 0.0, 0.01, 0.05, 0.12}) {
    for (double t : {0.25, 1.0, 2.5, 10.0}) {
      for (int f : {1, 2, 4, 12}) {
        const double c = simple_to_compounded(r, t, f);
        const double back = compounded_to_simple(c, t, f);
        devmax = std::max(devmax, std::abs(back - r));
      }
    }
  }
  assert(devmax < 1e-9);

  // 5) Domaine
  assert(throws<bw::DomainError>([]{ (void)simple_to_compounded(0.05, 0.0, 2); }));
  assert(throws<bw::DomainError>([]{ (void)compounded_to_simple(0.05, -1.0, 2); }));
  assert(throws<bw::DomainError>([]{ (void)simple_to_compounded(0.05, 1.0, 0); }));
  // base négative, exposant non entier
  assert(throws<bw::DomainError>([]{ (void)simple_to_compounded(-3.0, 1.0, 2); }));
  assert(throws<bw::DomainError>([]{ (void)compounded_to_simple(-3.0, 1.25, 1); }));
  // base négative, exposant entier : défini
  assert(std::abs(compounded_to_simple(-3.0, 2.0, 1) - 1.5) < EPS);
  // base nulle : exposant toujours > 0, la puissance vaut 0
  assert(std::abs(simple_to_compounded(-1.0, 1.0, 1) - (-1.0)) < EPS);
  assert(std::abs(compounded_to_simple(-2.0, 1.0, 2) - (-1.0)) < EPS);
  // DomainError reste attrapable comme std::domain_error
  assert(throws<std::domain_error>([]{ (void)discount_factor(1.0, 1.0, -1.0); }));

  // 6) Arrondi de présentation
  assert(bw::core::round_to(1.23456, 4) == 1.2346);
  assert(bw::core::round_to(0.125, 2) == 0.12);   // half-to-even
  assert(bw::core::round_to(1.23456, -1) == 1.23456);

  std::cout << "Rates OK. Max round-trip dev=" << devmax << "\n";
  return 0;
}
