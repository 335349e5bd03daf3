#pragma once
/**
 * @file analytic_bs.hpp
 * @brief Prix fermés Black–Scholes d'options européennes (sans dividende).
 *
 * # Formules (valeurs au temps 0)
 *   Call = N(d1) * S - N(d2) * K * e^{-rt}
 *   Put  = -N(-d1) * S + N(-d2) * K * e^{-rt}
 *
 * d1/d2 viennent de compute_auxiliaries() et sont passés explicitement.
 *
 * # Tests
 * - Parité put–call : Call - Put == S - K e^{-rt} (tolérance relative 1e-9).
 * - Limites : S/K -> inf => Call -> S - K e^{-rt} ; S/K -> 0 => Call -> 0.
 */

namespace bsg {
namespace pricing {

/// @brief Prix call et put d'un même jeu d'entrées.
struct Prices {
  double call;
  double put;
};

/**
 * @brief Prix call et put.
 * @param S  Spot
 * @param K  Strike
 * @param r  Taux sans risque (décimal)
 * @param t  Maturité (années)
 * @param d1 Quantité auxiliaire d1
 * @param d2 Quantité auxiliaire d2
 * @throws bsg::core::NumericDegenerate si un argument ou un prix n'est pas fini.
 */
[[nodiscard]] Prices price(double S, double K, double r, double t, double d1, double d2);

[[nodiscard]] double price_call(double S, double K, double r, double t, double d1, double d2);
[[nodiscard]] double price_put (double S, double K, double r, double t, double d1, double d2);

/**
 * @brief Écart de parité put–call.
 * @return gap = call - put - ( S - K * e^{-rt} )  (≈ 0 en BS sans frictions)
 */
[[nodiscard]] double put_call_parity_gap(double call, double put,
                                         double S, double K, double r, double t) noexcept;

} // namespace pricing
} // namespace bsg
