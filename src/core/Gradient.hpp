// src/core/Gradient.hpp
//
// Closed-form subgradient of the mean absolute error with respect to the
// preference parameters.
//
// With residual signs \( s_{iu} = \operatorname{sign}(x_i \cdot p_u - r_{iu}) \)
// the gradient row of agent \( u \) is
//
// \[
// g_u = \frac{1}{|I||U|} \sum_i s_{iu} \, x_i
// \]
//
// or, for all agents at once, \( G = S^T X / (|I||U|) \).
//
// The absolute value has a corner at zero residual. This library fixes
// \( \operatorname{sign}(0) = 0 \): an item that is already predicted exactly
// contributes nothing to the update. Every backend and the finite-difference
// oracle below follow the same convention.
#ifndef GRADIENT_HPP
#define GRADIENT_HPP
#include "Types.hpp"

/**
 * @brief Validates the (params, target, features) triple shared by the
 *        gradient backends.
 *
 * Requires params.cols() == features.cols(), target.rows() == features.rows()
 * and target.cols() == params.rows().
 *
 * @throws ShapeMismatchError on any disagreement.
 */
void checkGradientShapes(const ParameterMatrix& params, const RatingMatrix& target,
                         const FeatureMatrix& features);

/**
 * @brief Residual signs \( S = \operatorname{sign}(X P^T - R) \) with sign(0) = 0.
 */
RatingMatrix residualSigns(const ParameterMatrix& params, const RatingMatrix& target,
                           const FeatureMatrix& features);

/**
 * @brief Gradient of meanAbsoluteError(predictAll(features, params), target).
 *
 * @param params Agent x F preference matrix.
 * @param target Item x Agent observed ratings.
 * @param features Item x F item features.
 * @return ParameterMatrix Agent x F subgradient.
 * @throws ShapeMismatchError on inconsistent shapes.
 * @throws DegenerateInputError if there are no items or no agents.
 */
ParameterMatrix maeGradient(const ParameterMatrix& params, const RatingMatrix& target,
                            const FeatureMatrix& features);

/**
 * @brief Central finite-difference approximation of the same gradient.
 *
 * Perturbs one parameter entry at a time by +/- epsilon. The loss is
 * piecewise linear, so this agrees with maeGradient() whenever no residual
 * changes sign within epsilon of the evaluation point. At an exact zero
 * residual it reports the average of the one-sided slopes, which for a single
 * kinked term is the same sign(0) = 0 convention.
 */
ParameterMatrix numericalGradient(const ParameterMatrix& params, const RatingMatrix& target,
                                  const FeatureMatrix& features, double epsilon = 1e-6);

#endif // GRADIENT_HPP
