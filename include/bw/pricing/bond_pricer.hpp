#pragma once
/**
 * @file bond_pricer.hpp
 * @brief Prix d’une obligation à coupons fixes.
 *
 * # Deux modes sur le même échéancier
 * 1) Courbe zéro-coupon (taux simples, un taux par date de paiement) :
 *      P = Σ_i CF_i / (1 + r_i t_i)
 *    r_i est aligné par position sur t_i (aucune interpolation).
 *    Arrondi à cfg.decimals (4 par défaut).
 *
 * 2) Rendement actuariel plat y composé f fois par an :
 *      P = Σ_i CF_i * (1 + y/f)^(-t_i f)
 *    Pleine précision : la duration réutilise ce prix. L’arrondi d’affichage
 *    est à la charge de l’appelant (cf. bond_statistics).
 *
 * # Erreurs
 * - LengthMismatchError : zero_rates.size() != nombre de paiements
 *   (jamais de troncature ni de complétion silencieuse).
 * - DomainError         : 1 + r_i t_i == 0, ou 1 + y/f <= 0.
 * - InvalidBondError    : échéancier vide / non entier (cf. PeriodCountPolicy).
 */

#include <vector>

#include <bw/config/pricing_config.hpp>
#include <bw/market/bond.hpp>

namespace bw {
namespace pricing {

/**
 * @brief Prix à partir d’une courbe de taux zéro-coupon simples.
 * @param bond       Obligation
 * @param zero_rates Un taux simple par période de paiement
 * @param cfg        Conventions (comptage des périodes, arrondi)
 * @return Prix arrondi à cfg.decimals
 */
double price_from_curve(const bw::market::Bond& bond,
                        const std::vector<double>& zero_rates,
                        const bw::config::PricingConfig& cfg = bw::config::PricingConfig{});

/**
 * @brief Prix à partir d’un rendement composé plat (pleine précision).
 * @param bond             Obligation
 * @param compounded_yield Rendement composé bond.frequency fois par an
 * @param cfg              Conventions (seul le comptage des périodes est utilisé)
 */
double price_from_yield(const bw::market::Bond& bond,
                        double compounded_yield,
                        const bw::config::PricingConfig& cfg = bw::config::PricingConfig{});

} // namespace pricing
} // namespace bw
