#include <bw/rates/discount.hpp>

#include <bw/core/errors.hpp>
#include <bw/core/rounding.hpp>

#include <cmath>   // std::pow, std::trunc, std::isfinite
#include <string>

namespace bw {
namespace rates {

namespace {

// base^exponent avec contrôle du domaine réel.
double checked_pow(double base, double exponent, const char* where) {
  if (base < 0.0 && std::trunc(exponent) != exponent) {
    throw DomainError(std::string(where) + ": negative base with non-integral exponent");
  }
  const double v = std::pow(base, exponent);
  if (!std::isfinite(v)) {
    throw DomainError(std::string(where) + ": non-finite power");
  }
  return v;
}

void check_horizon(double t, int freq, const char* where) {
  const double n = t * static_cast<double>(freq);
  if (!(n > 0.0)) {
    throw DomainError(std::string(where) + ": t * freq must be > 0");
  }
}

} // unnamed namespace

double discount_factor(double face, double tenor, double rate) {
  const double denom = 1.0 + rate * tenor;
  if (denom == 0.0) {
    throw DomainError("discount_factor: 1 + rate * tenor == 0");
  }
  return face / denom;
}

double simple_to_compounded(double simple_rate, double t, int freq) {
  check_horizon(t, freq, "simple_to_compounded");
  const double f = static_cast<double>(freq);
  const double growth = checked_pow(1.0 + simple_rate * t, 1.0 / (t * f), "simple_to_compounded");
  return (growth - 1.0) * f;
}

double compounded_to_simple(double comp_rate, double t, int freq) {
  check_horizon(t, freq, "compounded_to_simple");
  const double f = static_cast<double>(freq);
  const double growth = checked_pow(1.0 + comp_rate / f, t * f, "compounded_to_simple");
  return (growth - 1.0) / t;
}

double present_value(double cf, double simple_rate, double tau) {
  return core::round_to(discount_factor(1.0, tau, simple_rate) * cf, 4);
}

} // namespace rates
} // namespace bw
