#pragma once
/**
 * @file auxiliaries.hpp
 * @brief Quantités auxiliaires d1, d2 du modèle Black–Scholes.
 *
 *   d1 = [ ln(S/K) + (r + 0.5*sigma^2) t ] / (sigma * sqrt(t))
 *   d2 = d1 - sigma * sqrt(t)
 *
 * Calculées une fois par jeu d'entrées puis partagées par le pricer et les
 * Greeks (pas de recalcul).
 */

#include <bsg/market/market_inputs.hpp>

namespace bsg {
namespace pricing {

/// @brief Couple (d1, d2), immuable une fois calculé.
struct Auxiliaries {
  double d1;
  double d2;
};

/**
 * @brief Calcule d1 et d2.
 * @param sigma Volatilité (> 0)
 * @param S     Spot (> 0)
 * @param K     Strike (> 0)
 * @param r     Taux sans risque (décimal)
 * @param t     Maturité en années (> 0)
 * @throws bsg::core::InvalidInput      entrées hors domaine (y compris NaN).
 * @throws bsg::core::NumericDegenerate sigma*sqrt(t) nul après arrondi, ou d1/d2 non finis.
 */
[[nodiscard]] Auxiliaries compute_auxiliaries(double sigma, double S, double K,
                                              double r, double t);

/// @brief Variante sur un jeu d'entrées déjà validé.
[[nodiscard]] Auxiliaries compute_auxiliaries(const bsg::market::MarketInputs& in);

} // namespace pricing
} // namespace bsg
