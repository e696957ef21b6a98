#pragma once
/**
 * @file duration.hpp
 * @brief Duration de Macaulay, duration modifiée et statistiques d’une obligation.
 *
 * # Macaulay
 *    D = Σ_i w_i / P,   P = price_from_yield(bond, y)  (pleine précision)
 * avec, selon cfg.duration_convention :
 *  - Reference : w_i = t_i * exp(-y t_i) * CF_i
 *  - Periodic  : w_i = t_i * (1 + y/f)^(-t_i f) * CF_i
 *
 * ATTENTION : la convention Reference (défaut) mélange une décroissance
 * continue dans les poids et un prix en composition périodique. Elle est
 * conservée volontairement pour reproduire les sorties de référence ; à y > 0
 * elle donne une duration légèrement inférieure à la duration "manuel".
 *
 * # Modifiée
 *    D_mod = D / (1 + y/f)
 * calculée sur D en pleine précision, arrondie une seule fois en sortie.
 *
 * # Arrondi
 * Toutes les sorties publiques sont arrondies à cfg.decimals (4 par défaut).
 */

#include <bw/config/pricing_config.hpp>
#include <bw/market/bond.hpp>

namespace bw {
namespace pricing {

/// @brief Prix et sensibilités d’une obligation à un rendement donné.
struct BondStatistics {
  double price;    ///< price_from_yield arrondi à cfg.decimals.
  double macaulay; ///< Duration de Macaulay (années).
  double modified; ///< Duration modifiée (années).
};

/// @brief Duration de Macaulay, arrondie à cfg.decimals.
double macaulay_duration(const bw::market::Bond& bond,
                         double compounded_yield,
                         const bw::config::PricingConfig& cfg = bw::config::PricingConfig{});

/// @brief Duration modifiée = Macaulay / (1 + y/f), arrondie à cfg.decimals.
double modified_duration(const bw::market::Bond& bond,
                         double compounded_yield,
                         const bw::config::PricingConfig& cfg = bw::config::PricingConfig{});

/// @brief Prix (arrondi), Macaulay et modifiée en un appel.
BondStatistics bond_statistics(const bw::market::Bond& bond,
                               double compounded_yield,
                               const bw::config::PricingConfig& cfg = bw::config::PricingConfig{});

} // namespace pricing
} // namespace bw
