#pragma once
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include <bw/analytics/yield_sweep.hpp>

namespace bw::io {

struct CurveRow {
  double t    = std::numeric_limits<double>::quiet_NaN(); // maturité (années)
  double rate = std::numeric_limits<double>::quiet_NaN(); // taux zéro-coupon simple
};

// Lit une courbe zéro-coupon CSV (en-tête obligatoire, synonymes acceptés :
// t|maturity|tenor et rate|zero_rate|zc). Lignes vides et "#..." ignorées.
// Filtre les lignes invalides (t<=0, t ou taux non numérique).
// Retourne uniquement les lignes **valides**, dans l'ordre du fichier.
std::vector<CurveRow>
read_zero_curve_csv(const std::string& path,
                    std::size_t* num_ignored = nullptr,
                    std::vector<std::string>* warnings = nullptr);

// Colonne des taux, alignée par position sur l'échéancier.
std::vector<double> curve_rates(const std::vector<CurveRow>& rows);

// Écrit "yield,price,macaulay,modified". false + message si échec d'écriture.
bool write_sweep_csv(const std::string& path,
                     const std::vector<bw::analytics::SweepPoint>& points,
                     std::string* err = nullptr);

} // namespace bw::io
