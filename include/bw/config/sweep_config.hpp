#pragma once
/**
 * @file sweep_config.hpp
 * @brief Grille de rendements pour les courbes prix/rendement et duration/rendement.
 *
 * n_points rendements équidistants dans [y_min, y_max] (bornes incluses).
 * n_points == 1 ⇒ seul y_min est évalué.
 */

#include <cstddef> // std::size_t

namespace bw {
namespace config {

struct SweepConfig {
  double      y_min    = 0.0;   ///< Premier rendement (composé, décimal).
  double      y_max    = 0.10;  ///< Dernier rendement.
  std::size_t n_points = 41;    ///< Nombre de points (>= 1).
};

} // namespace config
} // namespace bw
