// src/core/util.cpp
//
// Implementation of utility functions for the **ParallelPreferenceEngine**
// core library.
//
// This file provides:
// • Fixture generation (boolean item features, normal preferences, exact
//   ratings) for simulations and the correctness harness.
// • A ranking helper turning a column of predicted ratings into a
//   recommendation order.
#include "util.hpp"
#include "Predictor.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

/**
 * @brief Boolean features drawn as independent Bernoulli(p) entries.
 */
FeatureMatrix generateItemFeatures(const RandomKey& key, Index num_items, Index num_features, double p) {
    return bernoulliMatrix(key, num_items, num_features, p);
}

/**
 * @brief Ground-truth preferences drawn from the standard normal.
 */
ParameterMatrix generatePreferences(const RandomKey& key, Index num_agents, Index num_features) {
    return normalMatrix(key, num_agents, num_features);
}

/**
 * @brief Exact ratings with no noise term.
 */
RatingMatrix generateRatings(const FeatureMatrix& features, const ParameterMatrix& preferences) {
    return predictAll(features, preferences);
}

/**
 * @brief Stable descending sort of one prediction column.
 *
 * The column must be finite: NaN breaks the strict weak ordering the sort
 * relies on.
 */
std::vector<Index> rankItems(const RatingMatrix& predictions, Index agent, const std::vector<Index>& exclude) {
    if (agent < 0 || agent >= predictions.cols()) {
        throw std::out_of_range("agent " + std::to_string(agent) + " not in prediction matrix with " +
                                std::to_string(predictions.cols()) + " agents");
    }
    if (!predictions.col(agent).allFinite()) {
        throw std::invalid_argument("predictions of agent " + std::to_string(agent) + " are not finite");
    }
    const std::unordered_set<Index> skip(exclude.begin(), exclude.end());
    std::vector<Index> order;
    order.reserve(static_cast<size_t>(predictions.rows()));
    for (Index i = 0; i < predictions.rows(); ++i) {
        if (skip.count(i) == 0) order.push_back(i);
    }
    // stable_sort keeps ascending index order among equal scores
    std::stable_sort(order.begin(), order.end(), [&predictions, agent](Index a, Index b) {
        return predictions(a, agent) > predictions(b, agent);
    });
    return order;
}
