#include <bsg/core/normal.hpp>

#include <cmath> // erfc, exp

namespace bsg {
namespace core {

namespace {
constexpr double INV_SQRT2   = 0.70710678118654752440084436210484903928; // 1/sqrt(2)
constexpr double INV_SQRT2PI = 0.39894228040143267793994605993438;       // 1/sqrt(2π)
} // unnamed namespace

double norm_cdf(double x) noexcept {
  // N(x) = 0.5 * erfc(-x / sqrt(2))
  return 0.5 * std::erfc(-x * INV_SQRT2);
}

double norm_pdf(double x) noexcept {
  return INV_SQRT2PI * std::exp(-0.5 * x * x);
}

} // namespace core
} // namespace bsg
