// src/core/util.hpp
//
// Utility header for the **ParallelPreferenceEngine** framework.
// Provides fixture generation for simulations and tests, and a ranking
// helper for consumers of the predicted rating matrix.
//
// Generators take an explicit RandomKey and never share generator state;
// split the key once per call site.
#ifndef UTIL_HPP
#define UTIL_HPP
#include <vector>
#include "RandomKey.hpp"
#include "Types.hpp"

/**
 * @brief Items x F boolean features (0/1), each set with probability p.
 */
FeatureMatrix generateItemFeatures(const RandomKey& key, Index num_items, Index num_features, double p = 0.5);

/**
 * @brief Agents x F ground-truth preferences with standard normal entries.
 */
ParameterMatrix generatePreferences(const RandomKey& key, Index num_agents, Index num_features);

/**
 * @brief Noise-free ratings of `preferences` on `features`, i.e. predictAll().
 */
RatingMatrix generateRatings(const FeatureMatrix& features, const ParameterMatrix& preferences);

/**
 * @brief Catalog indices ordered by descending predicted rating for one agent.
 *
 * Ties keep ascending index order. Items listed in `exclude` (typically the
 * ones the agent already rated) are left out.
 *
 * @throws std::out_of_range if `agent` is not a column of `predictions`.
 * @throws std::invalid_argument if that column holds a NaN or infinity.
 */
std::vector<Index> rankItems(const RatingMatrix& predictions, Index agent,
                             const std::vector<Index>& exclude = {});

#endif // UTIL_HPP
