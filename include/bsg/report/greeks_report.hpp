#pragma once
/**
 * @file greeks_report.hpp
 * @brief Couche de présentation : mise à l'échelle du Theta et tableau texte.
 */

#include <string>

#include <bsg/config/report_config.hpp>
#include <bsg/market/market_inputs.hpp>
#include <bsg/pricing/greeks.hpp>

namespace bsg {
namespace report {

/// @brief Theta par jour calendaire.
/// @throws std::invalid_argument si days_per_year <= 0.
[[nodiscard]] double theta_per_day(double theta, double days_per_year);

/// @brief Theta par jour multiplié par cfg.display_scale.
[[nodiscard]] double theta_display(double theta, const bsg::config::ReportConfig& cfg);

/// @brief Tableau texte (entrées, d1/d2, prix, parité, Greeks par contrat).
std::string format_report(const bsg::pricing::Valuation& v,
                          const bsg::market::MarketInputs& in,
                          const bsg::config::ReportConfig& cfg);

} // namespace report
} // namespace bsg
