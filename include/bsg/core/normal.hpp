#pragma once
/**
 * @file normal.hpp
 * @brief Loi normale standard : densité phi(x) et fonction de répartition N(x).
 *
 * - N(x) = 0.5 * erfc(-x / sqrt(2))   (erfc plus stable que 1 + erf dans la queue gauche)
 * - phi(x) = exp(-x^2 / 2) / sqrt(2 pi)
 *
 * Pour |x| grand, phi(x) et N(-|x|) valent exactement 0.0 : c'est un résultat
 * fini valide (pas une erreur).
 */

namespace bsg {
namespace core {

/// @brief Fonction de répartition N(x) de la loi normale standard.
[[nodiscard]] double norm_cdf(double x) noexcept;

/// @brief Densité phi(x) de la loi normale standard.
[[nodiscard]] double norm_pdf(double x) noexcept;

} // namespace core
} // namespace bsg
