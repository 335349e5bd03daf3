#include <bsg/pricing/analytic_bs.hpp>
#include <bsg/core/errors.hpp>
#include <bsg/core/normal.hpp>
#include <bsg/market/market_inputs.hpp>

#include <cmath> // exp, isfinite
#include <string>

namespace bsg {
namespace pricing {

using bsg::core::norm_cdf;

namespace {

void require_finite_args(const char* where, double d1, double d2) {
  if (!std::isfinite(d1) || !std::isfinite(d2)) {
    throw bsg::core::NumericDegenerate(std::string(where) + ": d1/d2 must be finite");
  }
}

double checked(const char* where, double value) {
  if (!std::isfinite(value)) {
    throw bsg::core::NumericDegenerate(std::string(where) + ": result is not finite");
  }
  return value;
}

} // unnamed namespace

double price_call(double S, double K, double r, double t, double d1, double d2) {
  bsg::market::validate_pricing_inputs("price_call", S, K, r, t);
  require_finite_args("price_call", d1, d2);
  const double df = std::exp(-r * t);
  return checked("price_call", norm_cdf(d1) * S - norm_cdf(d2) * K * df);
}

double price_put(double S, double K, double r, double t, double d1, double d2) {
  bsg::market::validate_pricing_inputs("price_put", S, K, r, t);
  require_finite_args("price_put", d1, d2);
  const double df = std::exp(-r * t);
  return checked("price_put", -norm_cdf(-d1) * S + norm_cdf(-d2) * K * df);
}

Prices price(double S, double K, double r, double t, double d1, double d2) {
  return { price_call(S, K, r, t, d1, d2), price_put(S, K, r, t, d1, d2) };
}

double put_call_parity_gap(double call, double put,
                           double S, double K, double r, double t) noexcept {
  const double df = std::exp(-r * t);
  // gap = call - put - ( S - K e^{-rt} )
  return call - put - (S - K * df);
}

} // namespace pricing
} // namespace bsg
