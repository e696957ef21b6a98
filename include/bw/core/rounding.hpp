#pragma once
/**
 * @file rounding.hpp
 * @brief Arrondi de présentation (sorties publiques uniquement).
 *
 * Arrondi "half-to-even" à `decimals` décimales : nearbyint(x * 10^d) / 10^d
 * sous le mode d’arrondi par défaut (FE_TONEAREST).
 * Si decimals < 0 : pas d’arrondi (identité).
 *
 * Ne jamais appliquer sur des sommes intermédiaires.
 */

namespace bw {
namespace core {

/// @brief Arrondit x à `decimals` décimales (identité si decimals < 0).
[[nodiscard]] double round_to(double x, int decimals) noexcept;

} // namespace core
} // namespace bw
