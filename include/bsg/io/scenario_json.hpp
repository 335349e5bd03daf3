#pragma once
/**
 * @file scenario_json.hpp
 * @brief Lecture d'un scénario JSON et export du rapport JSON (Qt Core).
 *
 * # Format du scénario
 * {
 *   "market": { "S": 819.42, "K": 1020, "r": 0.01, "t": 0.115068, "sigma": 0.6966 },
 *   "report": { "days_per_year": 365, "display_scale": 100, "precision": 6,
 *               "contract": "both" }
 * }
 * - "days_to_expiry" peut remplacer "t" (t = jours / days_per_year).
 * - Clés "report" absentes => valeurs par défaut de ReportConfig.
 * - Clé "market" absente ou non numérique => InvalidInput.
 */

#include <string>

#include <QJsonObject>

#include <bsg/config/report_config.hpp>
#include <bsg/market/market_inputs.hpp>
#include <bsg/pricing/greeks.hpp>

namespace bsg {
namespace io {

struct Scenario {
  bsg::market::MarketInputs  market;
  bsg::config::ReportConfig  report;
};

/// @brief Construit un scénario depuis un objet JSON.
/// @throws bsg::core::InvalidInput, bsg::core::InvalidContractType
Scenario scenario_from_json(const QJsonObject& root);

/// @brief Lit un fichier de scénario.
/// @throws std::runtime_error (fichier illisible / JSON invalide), InvalidInput.
Scenario load_scenario(const std::string& path);

/// @brief Sérialise un scénario (réutilisable tel quel par load_scenario).
QJsonObject scenario_to_json(const Scenario& s);

/// @brief Rapport JSON : entrées, d1/d2, prix, parité, Greeks (annuel + affichage).
QJsonObject report_to_json(const bsg::pricing::Valuation& v,
                           const bsg::market::MarketInputs& in,
                           const bsg::config::ReportConfig& cfg);

/// @throws std::runtime_error si le fichier ne peut pas être écrit.
void write_report_json(const std::string& path,
                       const bsg::pricing::Valuation& v,
                       const bsg::market::MarketInputs& in,
                       const bsg::config::ReportConfig& cfg);

} // namespace io
} // namespace bsg
