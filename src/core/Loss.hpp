// src/core/Loss.hpp
//
// Mean absolute error between a predicted and an observed rating matrix:
//
// \[
// L(\hat R, R) = \frac{1}{|I||U|} \sum_{i,u} |\hat r_{iu} - r_{iu}|
// \]
//
// Non-negative, zero exactly when the matrices agree entrywise, and not
// differentiable where a residual is zero (see Gradient.hpp).
#ifndef LOSS_HPP
#define LOSS_HPP
#include "Types.hpp"

/**
 * @brief Mean absolute error over all Item x Agent entries.
 *
 * @throws ShapeMismatchError if the shapes differ.
 * @throws DegenerateInputError if the matrices are empty.
 */
double meanAbsoluteError(const RatingMatrix& predicted, const RatingMatrix& target);

/**
 * @brief Verifies that `predicted` and `target` can be compared entrywise.
 */
void checkSameShape(const RatingMatrix& predicted, const RatingMatrix& target);

#endif // LOSS_HPP
