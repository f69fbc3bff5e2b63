// src/core/Gradient.cpp
//
// Sequential reference implementation of the MAE subgradient and its
// finite-difference oracle. The parallel backends in Engine.cpp and
// CudaEngine.cu reproduce maeGradient() up to summation order.
#include "Gradient.hpp"
#include "Loss.hpp"
#include "Predictor.hpp"
#include <string>

/**
 * @brief Checks the three dimension pairings shared by every gradient backend.
 */
void checkGradientShapes(const ParameterMatrix& params, const RatingMatrix& target,
                         const FeatureMatrix& features) {
    if (params.cols() != features.cols()) {
        throw ShapeMismatchError("preferences have " + std::to_string(params.cols()) +
                                 " features but items have " + std::to_string(features.cols()));
    }
    if (target.rows() != features.rows()) {
        throw ShapeMismatchError("target ratings cover " + std::to_string(target.rows()) +
                                 " items but the feature matrix has " + std::to_string(features.rows()));
    }
    if (target.cols() != params.rows()) {
        throw ShapeMismatchError("target ratings cover " + std::to_string(target.cols()) +
                                 " agents but the parameter matrix has " + std::to_string(params.rows()));
    }
}

/**
 * @brief Item x Agent matrix of sign(predicted - target).
 */
RatingMatrix residualSigns(const ParameterMatrix& params, const RatingMatrix& target,
                           const FeatureMatrix& features) {
    checkGradientShapes(params, target, features);
    // Eigen's sign() maps 0 to 0.
    return (predictAll(features, params) - target).cwiseSign();
}

/**
 * @brief Closed-form subgradient S^T X / (|I||U|).
 */
ParameterMatrix maeGradient(const ParameterMatrix& params, const RatingMatrix& target,
                            const FeatureMatrix& features) {
    checkGradientShapes(params, target, features);
    if (target.size() == 0) {
        throw DegenerateInputError("gradient needs at least one item and one agent");
    }
    const double scale = 1.0 / static_cast<double>(target.size());
    const RatingMatrix signs = residualSigns(params, target, features);
    // (Agent x Item) * (Item x F)
    return scale * (signs.transpose() * features);
}

/**
 * @brief Central differences, one parameter entry at a time.
 *
 * Costs two loss evaluations per entry; meant for tests only.
 */
ParameterMatrix numericalGradient(const ParameterMatrix& params, const RatingMatrix& target,
                                  const FeatureMatrix& features, double epsilon) {
    checkGradientShapes(params, target, features);
    ParameterMatrix probe = params;
    ParameterMatrix grad(params.rows(), params.cols());
    for (Index u = 0; u < params.rows(); ++u) {
        for (Index k = 0; k < params.cols(); ++k) {
            const double original = probe(u, k);
            probe(u, k) = original + epsilon;
            const double upper = meanAbsoluteError(predictAll(features, probe), target);
            probe(u, k) = original - epsilon;
            const double lower = meanAbsoluteError(predictAll(features, probe), target);
            probe(u, k) = original;
            grad(u, k) = (upper - lower) / (2.0 * epsilon);
        }
    }
    return grad;
}
