#pragma once
/**
 * @file errors.hpp
 * @brief Taxonomie des erreurs de la lib (exceptions).
 *
 * - DomainError         : domaine mathématique invalide (division par zéro
 *                         dans l’actualisation, puissance réelle d’une base négative…).
 * - LengthMismatchError : courbe zéro-coupon de taille != nombre de paiements.
 * - InvalidBondError    : nominal, maturité ou fréquence non strictement positifs,
 *                         ou échéancier vide.
 *
 * Chaque erreur dérive de l’exception standard la plus proche : un appelant
 * peut donc attraper std::invalid_argument / std::domain_error sans connaître bw.
 */

#include <stdexcept>

namespace bw {

struct DomainError : std::domain_error {
  using std::domain_error::domain_error;
};

struct LengthMismatchError : std::length_error {
  using std::length_error::length_error;
};

struct InvalidBondError : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

} // namespace bw
