#pragma once
/**
 * @file market_inputs.hpp
 * @brief Entrées de marché d'un calcul Black–Scholes à paramètres constants.
 *
 * # Contenu
 * - Spot S (> 0).
 * - Strike K (> 0).
 * - Taux sans risque r (décimal, peut être ~0 ou négatif).
 * - Maturité t (> 0, en années fractionnelles).
 * - Volatilité implicite sigma (> 0, annualisée).
 *
 * # Domaine valide
 * sigma = 0 ou t = 0 rend d1 indéfini (division par sigma*sqrt(t)) : ces
 * valeurs sont rejetées à la construction, pas propagées en NaN.
 */

namespace bsg {
namespace market {

/// @brief Jeu d'entrées immuable, validé à la construction.
struct MarketInputs {
public:
  const double S;     ///< Spot (> 0).
  const double K;     ///< Strike (> 0).
  const double r;     ///< Taux sans risque (décimal).
  const double t;     ///< Maturité en années (> 0).
  const double sigma; ///< Volatilité implicite (> 0).

  /// @throws bsg::core::InvalidInput si S, K, t, sigma <= 0 ou non finis, ou r non fini.
  MarketInputs(double S, double K, double r, double t, double sigma);
};

/// @brief Vérifie le domaine (S, K, t, sigma > 0 et finis ; r fini).
/// @param where préfixe du message d'erreur (nom de l'opération appelante).
/// @throws bsg::core::InvalidInput
void validate_market_inputs(const char* where,
                            double S, double K, double r, double t, double sigma);

/// @brief Même contrôle sans sigma (pricer : sigma n'y intervient que via d1/d2).
/// @throws bsg::core::InvalidInput
void validate_pricing_inputs(const char* where, double S, double K, double r, double t);

} // namespace market
} // namespace bsg
