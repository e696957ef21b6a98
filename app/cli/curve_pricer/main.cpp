#include "bw/io/curve_csv.hpp"
#include "bw/market/bond.hpp"
#include "bw/pricing/bond_pricer.hpp"
#include "bw/schedule/cashflow_schedule.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cmath>

static void usage(const char* prog) {
  std::cerr << "Usage: " << prog << " -f curve.csv face tenor coupon freq [-w]\n"
            << "  curve.csv : colonnes t,rate (un taux simple par date de paiement)\n";
}

int main(int argc, char** argv) {
  std::string path;
  bool show_warnings = false;
  std::vector<std::string> pos;

  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if ((a=="-f" || a=="--file") && i+1<argc) { path = argv[++i]; }
    else if (a=="-w" || a=="--show-warnings") { show_warnings = true; }
    else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
    else pos.push_back(a);
  }
  if (path.empty() || pos.size() != 4) { usage(argv[0]); return 1; }

  double face, tenor, coupon; int freq;
  try {
    face   = std::stod(pos[0]);
    tenor  = std::stod(pos[1]);
    coupon = std::stod(pos[2]);
    freq   = std::stoi(pos[3]);
  } catch (const std::exception&) { usage(argv[0]); return 1; }

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  const auto rows = bw::io::read_zero_curve_csv(path, &ignored, &warnings);

  std::cout << "File: " << path << "\n";
  std::cout << "Valid rows: " << rows.size() << "\n";
  std::cout << "Ignored rows: " << ignored << "\n";

  try {
    const bw::market::Bond bond(face, tenor, coupon, freq);
    const auto sched = bw::schedule::build_schedule(bond);

    // l'alignement est positionnel : on signale les dates qui ne correspondent pas
    for (std::size_t i=0; i<rows.size() && i<sched.size(); ++i) {
      if (std::fabs(rows[i].t - sched.times[i]) > 1e-9) {
        warnings.push_back("t=" + std::to_string(rows[i].t) + " != date de paiement "
                           + std::to_string(sched.times[i]));
      }
    }

    const double price = bw::pricing::price_from_curve(bond, bw::io::curve_rates(rows));
    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(4) << "Price: " << price << "\n";
  } catch (const std::exception& e) {
    for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  if (show_warnings) {
    for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  }
  return 0;
}
