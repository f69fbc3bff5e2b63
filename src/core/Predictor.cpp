// src/core/Predictor.cpp
//
// Dot-product rating predictor, single and batched.
#include "Predictor.hpp"
#include <string>

/**
 * @brief Rating of one item by one agent.
 */
double predict(const Vector& item_features, const Vector& user_params) {
    if (item_features.size() != user_params.size()) {
        throw ShapeMismatchError("feature vector has length " + std::to_string(item_features.size()) +
                                 " but preference vector has length " + std::to_string(user_params.size()));
    }
    return item_features.dot(user_params);
}

/**
 * @brief Every item against every agent as one dense product.
 */
RatingMatrix predictAll(const FeatureMatrix& item_features, const ParameterMatrix& user_params) {
    if (item_features.cols() != user_params.cols()) {
        throw ShapeMismatchError("item features have " + std::to_string(item_features.cols()) +
                                 " columns but preferences have " + std::to_string(user_params.cols()));
    }
    // (Item x F) * (F x Agent)
    return item_features * user_params.transpose();
}
