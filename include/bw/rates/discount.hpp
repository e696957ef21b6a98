#pragma once
/**
 * @file discount.hpp
 * @brief Actualisation en taux simple et conversions simple <-> composé.
 *
 * # Formules
 * Facteur d’actualisation (taux simple) :
 *    DF(N, T, r) = N / (1 + r T)
 *
 * Simple -> composé (f paiements par an, sur un horizon t) :
 *    c = ((1 + r t)^(1/(t f)) - 1) * f
 *
 * Composé -> simple :
 *    r = ((1 + c/f)^(t f) - 1) / t
 *
 * Les deux conversions sont inverses l’une de l’autre pour (t, f) identiques.
 *
 * # Domaine
 * - 1 + r T != 0 pour l’actualisation.
 * - t f > 0 pour les conversions.
 * - Base négative ⇒ exposant entier exigé (l’exposant est toujours > 0).
 * Toute violation lève bw::DomainError (pas de NaN silencieux).
 *
 * # Unités
 * - Temps en années fractionnelles, taux en décimal.
 */

namespace bw {
namespace rates {

/**
 * @brief Prix d’un zéro-coupon de nominal `face` en taux simple.
 * @param face  Nominal (1.0 pour un facteur d’actualisation pur)
 * @param tenor Maturité en années
 * @param rate  Taux simple (décimal)
 * @return face / (1 + rate * tenor)
 * @throws bw::DomainError si 1 + rate * tenor == 0
 */
double discount_factor(double face, double tenor, double rate);

/**
 * @brief Convertit un taux simple en taux composé f fois par an.
 * @throws bw::DomainError hors domaine (cf. en-tête)
 */
double simple_to_compounded(double simple_rate, double t, int freq);

/**
 * @brief Convertit un taux composé f fois par an en taux simple.
 * @throws bw::DomainError hors domaine (cf. en-tête)
 */
double compounded_to_simple(double comp_rate, double t, int freq);

/**
 * @brief Valeur présente d’un flux unique actualisé au taux simple.
 * @return discount_factor(1, tau, simple_rate) * cf, arrondi à 4 décimales
 */
double present_value(double cf, double simple_rate, double tau);

} // namespace rates
} // namespace bw
