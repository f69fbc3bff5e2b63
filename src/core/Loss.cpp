// src/core/Loss.cpp
//
// Mean absolute error between predicted and observed rating matrices.
#include "Loss.hpp"
#include <string>

/**
 * @brief Throws ShapeMismatchError unless both matrices are Item x Agent
 *        of the same size.
 */
void checkSameShape(const RatingMatrix& predicted, const RatingMatrix& target) {
    if (predicted.rows() != target.rows() || predicted.cols() != target.cols()) {
        throw ShapeMismatchError("predicted ratings are " + std::to_string(predicted.rows()) + "x" +
                                 std::to_string(predicted.cols()) + " but target ratings are " +
                                 std::to_string(target.rows()) + "x" + std::to_string(target.cols()));
    }
}

/**
 * @brief Average of |predicted - target| over every entry.
 */
double meanAbsoluteError(const RatingMatrix& predicted, const RatingMatrix& target) {
    checkSameShape(predicted, target);
    if (predicted.size() == 0) {
        throw DegenerateInputError("loss over an empty rating matrix");
    }
    return (predicted - target).cwiseAbs().mean();
}
