#pragma once
/**
 * @file errors.hpp
 * @brief Erreurs remontées par le calculateur Black–Scholes.
 *
 * - InvalidInput        : S, K, t, sigma <= 0 ou non finis, r non fini.
 * - InvalidContractType : type de contrat hors {Call, Put}.
 * - NumericDegenerate   : entrées valides mais résultat non fini (overflow, 0/0).
 *
 * Toutes sont levées immédiatement, sans reprise : l'appelant distingue ainsi
 * "entrée invalide" de "résultat calculé", jamais un NaN présenté comme prix.
 */

#include <stdexcept> // std::invalid_argument, std::runtime_error

namespace bsg {
namespace core {

class InvalidInput : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class InvalidContractType : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class NumericDegenerate : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace core
} // namespace bsg
