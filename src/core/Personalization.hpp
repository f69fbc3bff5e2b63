// src/core/Personalization.hpp
//
// Cold-start personalization for the **ParallelPreferenceEngine**.
//
// New agents rate only R catalog items (often R <= F, an under-determined
// problem). Their preference vectors are fitted with the same engine and
// configuration as a full training run, restricted to the R observed rows of
// the catalog, and then scored against every catalog item. Ranking the
// resulting predictions is left to the caller (see rankItems() in util.hpp).
#ifndef PERSONALIZATION_HPP
#define PERSONALIZATION_HPP
#include <vector>
#include "Engine.hpp"
#include "RandomKey.hpp"
#include "Types.hpp"

/**
 * @brief Output of one personalization run.
 */
struct PersonalizationResult {
    ParameterMatrix params;     ///< M x F fitted preferences of the new agents.
    RatingMatrix predictions;   ///< Item x M predicted ratings over the full catalog.
    TrainingReport report;      ///< Diagnostics of the fit on the observed rows.
};

/**
 * @brief Rows of `catalog` selected by `items`, in the given order.
 *
 * @throws std::out_of_range if an index is outside the catalog.
 */
FeatureMatrix selectItems(const FeatureMatrix& catalog, const std::vector<Index>& items);

/**
 * @brief Fits M new agents on R observed ratings and predicts the full catalog.
 *
 * @param engine Engine whose backend evaluates the gradient.
 * @param key Random key for the fresh M x F parameter matrix.
 * @param catalog Item x F features of the whole catalog.
 * @param observed_items R catalog row indices that were rated.
 * @param observed_ratings R x M ratings, row r belonging to observed_items[r].
 * @param config Same round count and rate as a regular training run.
 * @throws std::out_of_range for an index outside the catalog.
 * @throws ShapeMismatchError if observed_ratings has other than R rows.
 * @throws DegenerateInputError if R or M is zero.
 * @throws NumericAnomalyError if training or any catalog prediction is non-finite.
 */
PersonalizationResult personalize(OptimizationEngine& engine, const RandomKey& key,
                                  const FeatureMatrix& catalog, const std::vector<Index>& observed_items,
                                  const RatingMatrix& observed_ratings, const TrainingConfig& config);

#endif // PERSONALIZATION_HPP
