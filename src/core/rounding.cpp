#include <bw/core/rounding.hpp>

#include <cmath> // std::nearbyint, std::pow, std::isfinite

namespace bw {
namespace core {

double round_to(double x, int decimals) noexcept {
  if (decimals < 0 || !std::isfinite(x)) {
    return x;
  }
  const double scale = std::pow(10.0, decimals);
  return std::nearbyint(x * scale) / scale;
}

} // namespace core
} // namespace bw
