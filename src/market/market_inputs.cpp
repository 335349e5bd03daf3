#include <bsg/market/market_inputs.hpp>
#include <bsg/core/errors.hpp>

#include <cmath>  // isfinite
#include <string>

namespace bsg {
namespace market {

namespace {
// !(x > 0) attrape aussi NaN
void require_positive(const char* where, const char* name, double x) {
  if (!(x > 0.0) || !std::isfinite(x)) {
    throw bsg::core::InvalidInput(std::string(where) + ": " + name + " must be > 0 and finite");
  }
}
} // unnamed namespace

void validate_pricing_inputs(const char* where, double S, double K, double r, double t) {
  require_positive(where, "S", S);
  require_positive(where, "K", K);
  require_positive(where, "t", t);
  if (!std::isfinite(r)) {
    throw bsg::core::InvalidInput(std::string(where) + ": r must be finite");
  }
}

void validate_market_inputs(const char* where,
                            double S, double K, double r, double t, double sigma) {
  validate_pricing_inputs(where, S, K, r, t);
  require_positive(where, "sigma", sigma);
}

MarketInputs::MarketInputs(double S, double K, double r, double t, double sigma)
    : S(S), K(K), r(r), t(t), sigma(sigma) {
  validate_market_inputs("MarketInputs", S, K, r, t, sigma);
}

} // namespace market
} // namespace bsg
