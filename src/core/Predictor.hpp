// src/core/Predictor.hpp
//
// Rating predictor of the **ParallelPreferenceEngine**.
//
// The model scores an (item, agent) pair as the dot product of the item's
// feature vector and the agent's preference vector:
//
// \[
// \hat r_{iu} = x_i \cdot p_u
// \]
//
// The batched form scores every item against every agent (a cartesian
// broadcast, not a row-wise pairing) and is evaluated as the dense product
// \( X P^T \).
#ifndef PREDICTOR_HPP
#define PREDICTOR_HPP
#include "Types.hpp"

/**
 * @brief Predicted rating of one item for one agent.
 *
 * @param item_features Feature vector of length F.
 * @param user_params Preference vector of length F.
 * @return double \( x \cdot p \)
 * @throws ShapeMismatchError if the lengths differ.
 */
double predict(const Vector& item_features, const Vector& user_params);

/**
 * @brief Predicted ratings of every item for every agent.
 *
 * @param item_features Item x F feature matrix.
 * @param user_params Agent x F preference matrix.
 * @return RatingMatrix Item x Agent matrix with entry (i,u) = predict(X[i], P[u]).
 * @throws ShapeMismatchError if the feature dimensions differ.
 */
RatingMatrix predictAll(const FeatureMatrix& item_features, const ParameterMatrix& user_params);

#endif // PREDICTOR_HPP
