// app/cli/yield_sweep/main.cpp
#include "bw/analytics/yield_sweep.hpp"
#include "bw/io/curve_csv.hpp"
#include "bw/market/bond.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cstdlib>
#include <algorithm>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " face tenor coupon freq [--ymin a] [--ymax b] [--n k] [-o out.csv] [--periodic]\n"
    "Options:\n"
    "  --ymin       premier rendement compose (def: 0.0)\n"
    "  --ymax       dernier rendement compose (def: 0.10)\n"
    "  --n          nb de points (def: 41)\n"
    "  -o / --out   CSV de sortie (defaut: tableau sur stdout)\n"
    "  --periodic   duration ponderee en composition periodique\n";
}

int main(int argc, char** argv){
  bw::config::SweepConfig sweep;
  bw::config::PricingConfig cfg;
  std::string out_path;
  std::vector<std::string> pos;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if (a=="--ymin" && i+1<argc) sweep.y_min = std::atof(argv[++i]);
    else if (a=="--ymax" && i+1<argc) sweep.y_max = std::atof(argv[++i]);
    else if (a=="--n" && i+1<argc) sweep.n_points = static_cast<std::size_t>(std::max(1, std::atoi(argv[++i])));
    else if ((a=="-o" || a=="--out") && i+1<argc) out_path = argv[++i];
    else if (a=="--periodic") cfg.duration_convention = bw::config::DurationConvention::Periodic;
    else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
    else pos.push_back(a);
  }
  if (pos.size() != 4){ usage(argv[0]); return 1; }

  std::vector<bw::analytics::SweepPoint> pts;
  try {
    const bw::market::Bond bond(std::stod(pos[0]), std::stod(pos[1]), std::stod(pos[2]), std::stoi(pos[3]));
    pts = bw::analytics::yield_sweep(bond, sweep, cfg);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  if (!out_path.empty()) {
    std::string err;
    if (!bw::io::write_sweep_csv(out_path, pts, &err)) {
      std::cerr << "error: " << err << "\n";
      return 3;
    }
    std::cout << "Wrote " << pts.size() << " points to " << out_path << "\n";
    return 0;
  }

  std::cout.setf(std::ios::fixed);
  std::cout << "   Yield        Price   Macaulay   Modified\n";
  for (const auto& p : pts) {
    std::cout << std::setprecision(6) << std::setw(8) << p.yield << ' '
              << std::setprecision(4) << std::setw(12) << p.price << ' '
              << std::setw(10) << p.macaulay << ' '
              << std::setw(10) << p.modified << '\n';
  }
  return 0;
}
