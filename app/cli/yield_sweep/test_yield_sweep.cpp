#include "bw/analytics/yield_sweep.hpp"
#include "bw/pricing/duration.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <stdexcept>

int main() {
  using bw::market::Bond;
  constexpr double EPS = 1e-12;
  const Bond b(100.0, 5.0, 0.05, 2);

  // 1) Grille 0% .. 8% en 5 points
  bw::config::SweepConfig sw;
  sw.y_min = 0.0; sw.y_max = 0.08; sw.n_points = 5;
  const auto pts = bw::analytics::yield_sweep(b, sw);
  assert(pts.size() == 5);
  assert(pts.front().yield == 0.0);
  assert(pts.back().yield == 0.08);
  assert(std::abs(pts.front().price - 125.0) < EPS);

  // prix strictement décroissant, duration modifiée positive
  for (std::size_t i = 1; i < pts.size(); ++i) {
    assert(pts[i].yield > pts[i-1].yield);
    assert(pts[i].price < pts[i-1].price);
    assert(pts[i].modified > 0.0);
  }

  // point 4% identique à bond_statistics
  const auto st = bw::pricing::bond_statistics(b, 0.04);
  assert(std::abs(pts[2].yield - 0.04) < EPS);
  assert(std::abs(pts[2].price - st.price) < EPS);
  assert(std::abs(pts[2].macaulay - st.macaulay) < EPS);
  assert(std::abs(pts[2].modified - st.modified) < EPS);

  // 2) Un seul point => y_min
  sw.n_points = 1;
  const auto one = bw::analytics::yield_sweep(b, sw);
  assert(one.size() == 1 && one[0].yield == 0.0);

  // 3) Grilles invalides
  bool caught = false;
  sw.n_points = 0;
  try { (void)bw::analytics::yield_sweep(b, sw); } catch (const std::invalid_argument&) { caught = true; }
  assert(caught);

  caught = false;
  sw.n_points = 3; sw.y_min = 0.05; sw.y_max = 0.01;
  try { (void)bw::analytics::yield_sweep(b, sw); } catch (const std::invalid_argument&) { caught = true; }
  assert(caught);

  std::cout << "Yield sweep OK.\n";
  return 0;
}
