#include "bw/io/curve_csv.hpp"
#include "bw/market/bond.hpp"
#include "bw/pricing/bond_pricer.hpp"
#include <iostream>
#include <fstream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <algorithm> // any_of
using namespace std;

int main(int argc, char** argv) {
  const string path = (argc>1 ? argv[1] : "data/curve_samples/sample_curve.csv");

  size_t ignored = 0;
  vector<string> warnings;
  auto rows = bw::io::read_zero_curve_csv(path, &ignored, &warnings);

  cout << "Valid rows: " << rows.size() << "\n";
  cout << "Ignored rows: " << ignored << "\n";

  constexpr double EPS = 1e-12;
  assert(rows.size() == 2);
  assert(ignored == 2);
  assert(std::abs(rows[0].t - 1.0) < EPS && std::abs(rows[0].rate - 0.05) < EPS);
  assert(std::abs(rows[1].t - 2.0) < EPS && std::abs(rows[1].rate - 0.055) < EPS); // champ entre guillemets

  auto has_warn = [&](const string& needle){
    return any_of(warnings.begin(), warnings.end(),
                  [&](const string& w){ return w.find(needle) != string::npos; });
  };
  assert(has_warn("t<=0 ou invalide"));
  assert(has_warn("taux invalide"));

  // Prix de l'obligation 2 ans à partir de la courbe lue
  const bw::market::Bond bond(100.0, 2.0, 0.06, 1);
  const double p = bw::pricing::price_from_curve(bond, bw::io::curve_rates(rows));
  assert(std::abs(p - 101.2098) < EPS);

  // Fichier absent : vide + avertissement
  vector<string> w2;
  auto none = bw::io::read_zero_curve_csv("does/not/exist.csv", nullptr, &w2);
  assert(none.empty());
  assert(!w2.empty());

  // Export d'un balayage
  const auto out = std::filesystem::temp_directory_path() / "bw_test_sweep.csv";
  vector<bw::analytics::SweepPoint> pts {{0.04, 104.4913, 4.4904, 4.4024}};
  string err;
  assert(bw::io::write_sweep_csv(out.string(), pts, &err));
  ifstream in(out);
  string header, line;
  getline(in, header);
  getline(in, line);
  assert(header == "yield,price,macaulay,modified");
  assert(line == "0.040000,104.4913,4.4904,4.4024");
  in.close();
  std::filesystem::remove(out);

  for (auto& w: warnings) cerr << "[warn] " << w << "\n";
  return 0;
}
