#pragma once
/**
 * @file pricing_config.hpp
 * @brief Conventions de calcul partagées par l’échéancier, le pricing et la duration.
 *
 * # Nombre de paiements (PeriodCountPolicy)
 * x = tenor * frequency
 * - Truncate : trunc(x). Attention : 0.29 * 100 = 28.999999999999996 ⇒ 28 paiements.
 * - Snap     : round(x) si |x - round(x)| <= count_tolerance, sinon trunc(x).
 * - Strict   : comme Snap, mais un résidu > count_tolerance lève InvalidBondError.
 *
 * # Pondération de la duration (DurationConvention)
 * - Reference : poids t * exp(-y t) * CF, prix en composition périodique.
 *               Convention mixte (continue / périodique) conservée telle quelle
 *               pour la parité des sorties. Ce n’est PAS la duration de Macaulay
 *               "manuel" : pour un zéro-coupon à y > 0 on obtient D < T.
 * - Periodic  : poids t * (1 + y/f)^(-t f) * CF, cohérent avec le prix.
 *
 * # Arrondi
 * - decimals : nombre de décimales des sorties publiques (4 par défaut).
 *              < 0 ⇒ pleine précision.
 * - modified_from_rounded : la duration modifiée divise la Macaulay déjà
 *              arrondie à decimals (défaut, 4.4904 / 1.02 ⇒ 4.4024). À false,
 *              elle divise la Macaulay pleine précision (⇒ 4.4023).
 */

namespace bw {
namespace config {

enum class PeriodCountPolicy { Truncate, Snap, Strict };
enum class DurationConvention { Reference, Periodic };

/// @brief Conventions d’un calcul de prix / duration.
struct PricingConfig {
  PeriodCountPolicy  count_policy;        ///< Calcul du nombre de paiements.
  double             count_tolerance;     ///< Tolérance du Snap/Strict.
  DurationConvention duration_convention; ///< Pondération de la duration.
  int                decimals;            ///< Décimales des sorties (<0 : aucun arrondi).
  bool               modified_from_rounded; ///< Modifiée calculée depuis la Macaulay arrondie.

  /// @brief Construit une configuration avec valeurs par défaut.
  PricingConfig(PeriodCountPolicy count_policy = PeriodCountPolicy::Snap,
                double count_tolerance = 1e-9,
                DurationConvention duration_convention = DurationConvention::Reference,
                int decimals = 4,
                bool modified_from_rounded = true) noexcept
      : count_policy(count_policy),
        count_tolerance(count_tolerance),
        duration_convention(duration_convention),
        decimals(decimals),
        modified_from_rounded(modified_from_rounded) {}
};

} // namespace config
} // namespace bw
