#pragma once
/**
 * @file greeks.hpp
 * @brief Greeks analytiques Black–Scholes : Delta, Gamma, Theta.
 *
 * # Formules
 * - Delta : call = N(d1) ; put = -N(-d1).
 * - Gamma : K e^{-rt} phi(d2) / (S^2 sigma sqrt(t))  (identique call/put).
 *   L'actualisation utilise r, le même taux que partout ailleurs
 *   (l'écriture e^{-et} de certaines dérivations est une coquille).
 * - Theta (par an, dV/dt calendaire) :
 *     call = -S sigma phi(d1) / (2 sqrt(t)) - r K e^{-rt} N(d2)
 *     put  = -S sigma phi(-d1) / (2 sqrt(t)) + r K e^{-rt} N(-d2)
 *
 * # Conventions
 * - Theta est annuel. La mise à l'échelle par jour (/365) et l'affichage (x100)
 *   relèvent de la présentation (voir bsg/report/greeks_report.hpp).
 * - Delta reçoit un seul d1, toujours celui utilisé dans la formule.
 *
 * # Erreurs
 * - ContractType hors {Call, Put} : InvalidContractType (jamais de valeur par défaut).
 * - Argument ou résultat non fini : NumericDegenerate.
 */

#include <bsg/market/contract.hpp>
#include <bsg/market/market_inputs.hpp>
#include <bsg/pricing/analytic_bs.hpp>
#include <bsg/pricing/auxiliaries.hpp>

namespace bsg {
namespace pricing {

/// @brief Sensibilités d'un contrat.
struct Greeks {
  double delta;
  double gamma;
  double theta; ///< annuel
};

/// @brief Delta d'un call ou d'un put.
/// @throws bsg::core::InvalidContractType, bsg::core::NumericDegenerate
[[nodiscard]] double delta(double d1, bsg::market::ContractType type);

/// @brief Gamma (indépendant du type de contrat).
/// @throws bsg::core::NumericDegenerate
[[nodiscard]] double gamma(double d2, double S, double K, double sigma, double r, double t);

/// @brief Theta annuel d'un call ou d'un put.
/// @throws bsg::core::InvalidContractType, bsg::core::NumericDegenerate
[[nodiscard]] double theta(double d1, double d2, double S, double K,
                           double sigma, double r, double t,
                           bsg::market::ContractType type);

/// @brief Les trois Greeks d'un contrat, à partir de d1/d2 déjà calculés.
[[nodiscard]] Greeks greeks(const bsg::market::MarketInputs& in,
                            const Auxiliaries& aux,
                            bsg::market::ContractType type);

/// @brief Résultat complet pour un jeu d'entrées.
struct Valuation {
  Auxiliaries aux;
  Prices      prices;
  Greeks      call;
  Greeks      put;
};

/// @brief d1/d2 calculés une seule fois, puis prix et Greeks des deux contrats.
[[nodiscard]] Valuation evaluate(const bsg::market::MarketInputs& in);

} // namespace pricing
} // namespace bsg
