#include <bsg/pricing/auxiliaries.hpp>
#include <bsg/core/errors.hpp>

#include <cmath> // log, sqrt, isfinite

namespace bsg {
namespace pricing {

Auxiliaries compute_auxiliaries(double sigma, double S, double K, double r, double t) {
  bsg::market::validate_market_inputs("compute_auxiliaries", S, K, r, t, sigma);

  const double sigSqrtT = sigma * std::sqrt(t);
  if (!(sigSqrtT > 0.0) || !std::isfinite(sigSqrtT)) {
    throw bsg::core::NumericDegenerate("compute_auxiliaries: sigma*sqrt(t) is not a positive finite number");
  }

  // regrouper ln(S/K) et drift * t avant la division
  const double logm = std::log(S / K);
  const double muT  = (r + 0.5 * sigma * sigma) * t;

  const double d1 = (logm + muT) / sigSqrtT;
  const double d2 = d1 - sigSqrtT;
  if (!std::isfinite(d1) || !std::isfinite(d2)) {
    throw bsg::core::NumericDegenerate("compute_auxiliaries: d1/d2 not finite");
  }
  return {d1, d2};
}

Auxiliaries compute_auxiliaries(const bsg::market::MarketInputs& in) {
  return compute_auxiliaries(in.sigma, in.S, in.K, in.r, in.t);
}

} // namespace pricing
} // namespace bsg
