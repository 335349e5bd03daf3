#include <bsg/pricing/greeks.hpp>
#include <bsg/core/errors.hpp>
#include <bsg/core/normal.hpp>

#include <cmath> // exp, sqrt, isfinite
#include <string>

namespace bsg {
namespace pricing {

using bsg::core::norm_cdf;
using bsg::core::norm_pdf;
using bsg::market::ContractType;

namespace {

void require_finite(const char* where, const char* name, double x) {
  if (!std::isfinite(x)) {
    throw bsg::core::NumericDegenerate(std::string(where) + ": " + name + " is not finite");
  }
}

[[noreturn]] void unknown_contract(const char* where) {
  throw bsg::core::InvalidContractType(std::string(where) + ": contract type must be Call or Put");
}

} // unnamed namespace

double delta(double d1, ContractType type) {
  require_finite("delta", "d1", d1);
  switch (type) {
    case ContractType::Call: return norm_cdf(d1);
    case ContractType::Put:  return -norm_cdf(-d1);
  }
  unknown_contract("delta");
}

double gamma(double d2, double S, double K, double sigma, double r, double t) {
  bsg::market::validate_market_inputs("gamma", S, K, r, t, sigma);
  require_finite("gamma", "d2", d2);
  const double df = std::exp(-r * t);
  const double g  = K * df * norm_pdf(d2) / (S * S * sigma * std::sqrt(t));
  require_finite("gamma", "result", g);
  return g;
}

double theta(double d1, double d2, double S, double K,
             double sigma, double r, double t, ContractType type) {
  bsg::market::validate_market_inputs("theta", S, K, r, t, sigma);
  require_finite("theta", "d1", d1);
  require_finite("theta", "d2", d2);

  const double df    = std::exp(-r * t);
  const double twoRt = 2.0 * std::sqrt(t);

  double th = 0.0;
  switch (type) {
    case ContractType::Call:
      th = -(S * sigma * norm_pdf(d1)) / twoRt - r * K * df * norm_cdf(d2);
      require_finite("theta", "result", th);
      return th;
    case ContractType::Put:
      th = -(S * sigma * norm_pdf(-d1)) / twoRt + r * K * df * norm_cdf(-d2);
      require_finite("theta", "result", th);
      return th;
  }
  unknown_contract("theta");
}

Greeks greeks(const bsg::market::MarketInputs& in, const Auxiliaries& aux, ContractType type) {
  Greeks g;
  g.delta = delta(aux.d1, type);
  g.gamma = gamma(aux.d2, in.S, in.K, in.sigma, in.r, in.t);
  g.theta = theta(aux.d1, aux.d2, in.S, in.K, in.sigma, in.r, in.t, type);
  return g;
}

Valuation evaluate(const bsg::market::MarketInputs& in) {
  const Auxiliaries aux = compute_auxiliaries(in);
  Valuation v;
  v.aux    = aux;
  v.prices = price(in.S, in.K, in.r, in.t, aux.d1, aux.d2);
  v.call   = greeks(in, aux, ContractType::Call);
  v.put    = greeks(in, aux, ContractType::Put);
  return v;
}

} // namespace pricing
} // namespace bsg
