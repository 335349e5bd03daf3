#include <bsg/core/errors.hpp>
#include <bsg/market/contract.hpp>
#include <bsg/market/market_inputs.hpp>
#include <bsg/pricing/analytic_bs.hpp>
#include <bsg/pricing/auxiliaries.hpp>
#include <bsg/pricing/greeks.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using bsg::market::ContractType;
using bsg::market::MarketInputs;

// Prix BS complet pour les différences finies
static double bs_price(double S, double K, double r, double t, double sigma, ContractType type) {
  const auto a = bsg::pricing::compute_auxiliaries(sigma, S, K, r, t);
  return type == ContractType::Call ? bsg::pricing::price_call(S, K, r, t, a.d1, a.d2)
                                    : bsg::pricing::price_put (S, K, r, t, a.d1, a.d2);
}

template <class E, class F>
static bool throws(F&& f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  using namespace bsg::pricing;

  // 1) Valeurs ATM connues
  {
    const auto a = compute_auxiliaries(0.2, 100.0, 100.0, 0.05, 1.0);
    assert(std::abs(delta(a.d1, ContractType::Call) - 0.6368306511756191) < 1e-12);
    assert(std::abs(delta(a.d1, ContractType::Put)  + 0.3631693488243809) < 1e-12);
    assert(std::abs(gamma(a.d2, 100.0, 100.0, 0.2, 0.05, 1.0) - 0.018762017345846895) < 1e-12);
    assert(std::abs(theta(a.d1, a.d2, 100.0, 100.0, 0.2, 0.05, 1.0, ContractType::Call) + 6.414027546438196) < 1e-10);
    assert(std::abs(theta(a.d1, a.d2, 100.0, 100.0, 0.2, 0.05, 1.0, ContractType::Put)  + 1.6578804239346256) < 1e-10);
  }

  // 2) Bornes de Delta, Delta_call - Delta_put == 1, Gamma >= 0 et symétrique
  const std::vector<MarketInputs> grid {
    {100.0, 100.0, 0.02, 1.0, 0.2},
    { 50.0, 100.0, 0.01, 0.25, 0.4},
    {150.0, 100.0, 0.03, 2.0, 0.15},
    {819.42, 1020.0, 0.01, 42.0/365.0, 0.6966},
    {100.0, 100.0, 0.0, 0.01, 0.05},
  };
  for (const auto& in : grid) {
    const auto a = compute_auxiliaries(in);
    const double dc = delta(a.d1, ContractType::Call);
    const double dp = delta(a.d1, ContractType::Put);
    assert(dc >= 0.0 && dc <= 1.0);
    assert(dp >= -1.0 && dp <= 0.0);
    assert(std::abs(dc - dp - 1.0) < 1e-12);

    const Greeks gc = greeks(in, a, ContractType::Call);
    const Greeks gp = greeks(in, a, ContractType::Put);
    assert(gc.gamma >= 0.0);
    assert(gc.gamma == gp.gamma);
    assert(gc.delta == dc && gp.delta == dp);
  }

  // 3) Cohérence avec les différences finies (Theta = dV/dt calendaire = -dV/dT)
  for (ContractType type : {ContractType::Call, ContractType::Put}) {
    const double S = 105.0, K = 100.0, r = 0.03, t = 0.5, sigma = 0.25;
    const auto a = compute_auxiliaries(sigma, S, K, r, t);

    const double hS = 1e-3 * S;
    const double up = bs_price(S + hS, K, r, t, sigma, type);
    const double mid = bs_price(S, K, r, t, sigma, type);
    const double dn = bs_price(S - hS, K, r, t, sigma, type);
    assert(std::abs((up - dn) / (2.0 * hS) - delta(a.d1, type)) < 1e-5);
    assert(std::abs((up - 2.0 * mid + dn) / (hS * hS) - gamma(a.d2, S, K, sigma, r, t)) < 1e-5);

    const double hT = 1e-5;
    const double fd_theta = (bs_price(S, K, r, t - hT, sigma, type)
                           - bs_price(S, K, r, t + hT, sigma, type)) / (2.0 * hT);
    assert(std::abs(fd_theta - theta(a.d1, a.d2, S, K, sigma, r, t, type)) < 1e-4);
  }

  // 4) Limites en moneyness pour Delta
  {
    const auto hi = compute_auxiliaries(0.2, 1e5, 100.0, 0.02, 1.0);
    assert(std::abs(delta(hi.d1, ContractType::Call) - 1.0) < 1e-12);
    const auto lo = compute_auxiliaries(0.2, 1e-2, 100.0, 0.02, 1.0);
    assert(delta(lo.d1, ContractType::Call) < 1e-12);
    assert(gamma(lo.d2, 1e-2, 100.0, 0.2, 0.02, 1.0) >= 0.0);
  }

  // 5) Type de contrat hors {Call, Put} : échec déterministe
  {
    const auto bogus = static_cast<ContractType>(7);
    assert(throws<bsg::core::InvalidContractType>([&]{ (void)delta(0.1, bogus); }));
    assert(throws<bsg::core::InvalidContractType>([&]{ (void)theta(0.1, 0.0, 100.0, 100.0, 0.2, 0.01, 1.0, bogus); }));
    assert(throws<bsg::core::InvalidContractType>([&]{ (void)bsg::market::to_string(bogus); }));
  }

  // 6) Parseur de type de contrat
  {
    assert(bsg::market::parse_contract_type("Call") == ContractType::Call);
    assert(bsg::market::parse_contract_type(" p ")  == ContractType::Put);
    assert(bsg::market::to_string(ContractType::Put) == "put");
    assert(throws<bsg::core::InvalidContractType>([]{ (void)bsg::market::parse_contract_type("straddle"); }));
    assert(throws<bsg::core::InvalidContractType>([]{ (void)bsg::market::parse_contract_type(""); }));
  }

  // 7) evaluate() : d1/d2 partagés, résultats identiques aux appels unitaires
  {
    const MarketInputs in(100.0, 90.0, 0.01, 0.3, 0.3);
    const Valuation v = evaluate(in);
    const auto a = compute_auxiliaries(in);
    assert(v.aux.d1 == a.d1 && v.aux.d2 == a.d2);
    assert(v.prices.call == price_call(in.S, in.K, in.r, in.t, a.d1, a.d2));
    assert(v.put.theta == theta(a.d1, a.d2, in.S, in.K, in.sigma, in.r, in.t, ContractType::Put));
  }

  // 8) Entrées hors domaine : InvalidInput (Gamma >= 0 ne doit jamais être violé)
  {
    using bsg::core::InvalidInput;
    assert(throws<InvalidInput>([]{ (void)gamma(0.15, 100.0, -100.0, 0.2, 0.05, 1.0); }));
    assert(throws<InvalidInput>([]{ (void)gamma(0.15, -100.0, 100.0, 0.2, 0.05, 1.0); }));
    assert(throws<InvalidInput>([]{ (void)gamma(0.15, 100.0, 100.0, 0.2, 0.05, 0.0); }));
    assert(throws<InvalidInput>([]{ (void)gamma(0.15, 100.0, 100.0, 0.0, 0.05, 1.0); }));
    assert(throws<InvalidInput>([]{ (void)theta(0.35, 0.15, 100.0, 100.0, -0.2, 0.05, 1.0, ContractType::Call); }));
    assert(throws<InvalidInput>([]{ (void)theta(0.35, 0.15, 100.0, 100.0, 0.2, 0.05, 0.0, ContractType::Put); }));
    assert(throws<InvalidInput>([]{ (void)theta(0.35, 0.15, -100.0, 100.0, 0.2, 0.05, 1.0, ContractType::Put); }));
    const double NaN = std::numeric_limits<double>::quiet_NaN();
    assert(throws<InvalidInput>([&]{ (void)gamma(0.15, 100.0, 100.0, 0.2, NaN, 1.0); }));
  }

  // 9) d1/d2 non finis : NumericDegenerate pour chaque Greek
  {
    using bsg::core::NumericDegenerate;
    const double NaN = std::numeric_limits<double>::quiet_NaN();
    const double Inf = std::numeric_limits<double>::infinity();
    assert(throws<NumericDegenerate>([&]{ (void)delta(NaN, ContractType::Call); }));
    assert(throws<NumericDegenerate>([&]{ (void)delta(-Inf, ContractType::Put); }));
    assert(throws<NumericDegenerate>([&]{ (void)gamma(NaN, 100.0, 100.0, 0.2, 0.05, 1.0); }));
    assert(throws<NumericDegenerate>([&]{ (void)gamma(Inf, 100.0, 100.0, 0.2, 0.05, 1.0); }));
    assert(throws<NumericDegenerate>([&]{ (void)theta(NaN, 0.15, 100.0, 100.0, 0.2, 0.05, 1.0, ContractType::Call); }));
    assert(throws<NumericDegenerate>([&]{ (void)theta(0.35, Inf, 100.0, 100.0, 0.2, 0.05, 1.0, ContractType::Put); }));
  }

  // 10) Octets non ASCII dans le texte du type de contrat
  assert(throws<bsg::core::InvalidContractType>([]{ (void)bsg::market::parse_contract_type("\xE9" "call" "\xA0"); }));
  assert(bsg::market::parse_contract_type("\tPUT\n") == ContractType::Put);

  std::cout << "Greeks OK.\n";
  return 0;
}
