#pragma once
/**
 * @file contract.hpp
 * @brief Type de contrat d'une option européenne (Call ou Put).
 *
 * Le type sélectionne la branche des formules de Delta et de Theta ;
 * Gamma n'en dépend pas.
 */

#include <string>

namespace bsg {
namespace market {

/// @brief Type d'option vanille.
enum class ContractType {
  Call, ///< Droit d'acheter le sous-jacent.
  Put   ///< Droit de vendre le sous-jacent.
};

/// @return "call" ou "put".
/// @throws bsg::core::InvalidContractType si la valeur n'est ni Call ni Put.
std::string to_string(ContractType type);

/// @brief Lit un type de contrat ("c", "call", "p", "put", casse ignorée).
/// @throws bsg::core::InvalidContractType pour tout autre texte (pas de défaut).
ContractType parse_contract_type(const std::string& text);

} // namespace market
} // namespace bsg
