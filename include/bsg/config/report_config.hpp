#pragma once
/**
 * @file report_config.hpp
 * @brief Paramètres de présentation des résultats (hors calculateur).
 *
 * # Conventions
 * - Theta est calculé par an ; Theta "affiché" = theta / days_per_year * display_scale.
 *   Avec les défauts (365, 100) on retrouve la colonne "Theta x100 / jour".
 * - contracts : quels contrats imprimer / exporter.
 */

namespace bsg {
namespace config {

enum class ContractSelection { Both, CallOnly, PutOnly };

/// @brief Configuration du rapport texte / JSON.
struct ReportConfig {
  double days_per_year = 365.0;  ///< Jours calendaires par an (Theta par jour).
  double display_scale = 100.0;  ///< Facteur d'affichage appliqué au Theta par jour.
  int    precision     = 6;      ///< Décimales du rapport texte.
  ContractSelection contracts = ContractSelection::Both;
};

} // namespace config
} // namespace bsg
