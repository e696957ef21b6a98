#include <bw/market/bond.hpp>
#include <bw/config/pricing_config.hpp>
#include <bw/pricing/duration.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <cstdlib>

struct Case {
  double face, tenor, coupon;
  int freq;
  double yield;
};

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [face tenor coupon freq yield]"
            << " [--periodic] [--count truncate|snap|strict] [--decimals N]\n"
            << "If no bond is provided, runs 3 reference cases.\n";
}

int main(int argc, char** argv) {
  std::vector<std::string> pos;
  bw::config::PricingConfig cfg;

  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if (a=="--periodic") cfg.duration_convention = bw::config::DurationConvention::Periodic;
    else if (a=="--count" && i+1<argc) {
      std::string p = argv[++i];
      if      (p=="truncate") cfg.count_policy = bw::config::PeriodCountPolicy::Truncate;
      else if (p=="snap")     cfg.count_policy = bw::config::PeriodCountPolicy::Snap;
      else if (p=="strict")   cfg.count_policy = bw::config::PeriodCountPolicy::Strict;
      else { std::cerr << "Unknown count policy: " << p << "\n"; print_usage(argv[0]); return 1; }
    }
    else if (a=="--decimals" && i+1<argc) cfg.decimals = std::atoi(argv[++i]);
    else if (a=="-h" || a=="--help") { print_usage(argv[0]); return 0; }
    else if (a.rfind("--",0)==0) { std::cerr << "Unknown arg: " << a << "\n"; print_usage(argv[0]); return 1; }
    else pos.push_back(a);
  }

  std::vector<Case> cases;
  if (pos.empty()) {
    // cas de référence
    cases.push_back({100.0,  5.0, 0.05, 2, 0.04});
    cases.push_back({100.0, 10.0, 0.06, 1, 0.05});
    cases.push_back({100.0,  3.0, 0.00, 1, 0.05}); // zéro-coupon
  } else if (pos.size() == 5) {
    Case c;
    try {
      c.face   = std::stod(pos[0]);
      c.tenor  = std::stod(pos[1]);
      c.coupon = std::stod(pos[2]);
      c.freq   = std::stoi(pos[3]);
      c.yield  = std::stod(pos[4]);
    } catch (const std::exception&) {
      print_usage(argv[0]);
      return 1;
    }
    cases.push_back(c);
  } else {
    print_usage(argv[0]);
    return 1;
  }

  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(4);

  std::cout << "    Face   Tenor  Coupon  Freq   Yield        Price   Macaulay   Modified\n";
  std::cout << "------------------------------------------------------------------------\n";
  try {
    for (const auto& c : cases) {
      const bw::market::Bond bond(c.face, c.tenor, c.coupon, c.freq);
      const auto st = bw::pricing::bond_statistics(bond, c.yield, cfg);

      std::cout << std::setw(8)  << c.face   << ' '
                << std::setw(7)  << c.tenor  << ' '
                << std::setw(7)  << c.coupon << ' '
                << std::setw(5)  << c.freq   << ' '
                << std::setw(7)  << c.yield  << ' '
                << std::setw(12) << st.price    << ' '
                << std::setw(10) << st.macaulay << ' '
                << std::setw(10) << st.modified << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
