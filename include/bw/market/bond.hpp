#pragma once
/**
 * @file bond.hpp
 * @brief Description d’une obligation à coupons fixes.
 *
 * # Contenu
 * - Nominal (face > 0).
 * - Maturité (tenor > 0, en années fractionnelles).
 * - Coupon annuel (coupon_rate >= 0, en décimal : 0.05 pour 5 %).
 * - Fréquence des paiements (frequency > 0, paiements par an).
 *
 * # Convention
 * - Le coupon par période vaut coupon_rate * face / frequency.
 * - Le nominal est remboursé avec le dernier coupon.
 * - Le nombre de paiements dépend de tenor * frequency (cf. PeriodCountPolicy).
 */

#include <bw/core/errors.hpp>

#include <cmath> // std::isfinite

namespace bw {
namespace market {

/// @brief Obligation à coupons fixes, immuable après construction.
struct Bond {
public:
  const double face;        ///< Nominal (> 0).
  const double tenor;       ///< Maturité en années (> 0).
  const double coupon_rate; ///< Coupon annuel en décimal (>= 0).
  const int    frequency;   ///< Paiements par an (> 0).

  /// @brief Construit une obligation valide.
  /// @throws bw::InvalidBondError si face <= 0, tenor <= 0, face ou tenor non fini, coupon_rate < 0 ou frequency <= 0.
  Bond(double face, double tenor, double coupon_rate, int frequency)
      : face(face), tenor(tenor), coupon_rate(coupon_rate), frequency(frequency) {
    // !(x > 0) attrape aussi les NaN
    if (!(face > 0.0)) {
      throw InvalidBondError("Bond: face must be > 0");
    }
    if (!(tenor > 0.0)) {
      throw InvalidBondError("Bond: tenor must be > 0");
    }
    if (!std::isfinite(face) || !std::isfinite(tenor)) {
      throw InvalidBondError("Bond: face and tenor must be finite");
    }
    if (!(coupon_rate >= 0.0)) {
      throw InvalidBondError("Bond: coupon_rate must be >= 0");
    }
    if (frequency <= 0) {
      throw InvalidBondError("Bond: frequency must be > 0");
    }
  }

  /// @return Montant d’un coupon périodique.
  double coupon_amount() const noexcept {
    return coupon_rate * face / static_cast<double>(frequency);
  }
};

} // namespace market
} // namespace bw
