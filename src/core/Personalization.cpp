// src/core/Personalization.cpp
//
// Cold-start flow: select the rated catalog rows, fit fresh preferences on
// them with the caller's engine, then score the whole catalog.
#include "Personalization.hpp"
#include "Predictor.hpp"
#include <stdexcept>
#include <string>

/**
 * @brief Copies the rated rows out of the catalog, checking every index.
 */
FeatureMatrix selectItems(const FeatureMatrix& catalog, const std::vector<Index>& items) {
    FeatureMatrix subset(static_cast<Index>(items.size()), catalog.cols());
    for (size_t r = 0; r < items.size(); ++r) {
        const Index item = items[r];
        if (item < 0 || item >= catalog.rows()) {
            throw std::out_of_range("item index " + std::to_string(item) + " outside catalog of " +
                                    std::to_string(catalog.rows()) + " items");
        }
        subset.row(static_cast<Index>(r)) = catalog.row(item);
    }
    return subset;
}

/**
 * @brief Validates the observation lists, fits on the observed rows and
 *        predicts every catalog item.
 *
 * Catalog rows that were never rated take no part in training, so a
 * non-finite feature there only shows up in the predictions; it is reported
 * as a NumericAnomalyError tagged with the final round.
 */
PersonalizationResult personalize(OptimizationEngine& engine, const RandomKey& key,
                                  const FeatureMatrix& catalog, const std::vector<Index>& observed_items,
                                  const RatingMatrix& observed_ratings, const TrainingConfig& config) {
    if (observed_ratings.rows() != static_cast<Index>(observed_items.size())) {
        throw ShapeMismatchError(std::to_string(observed_items.size()) + " observed items but " +
                                 std::to_string(observed_ratings.rows()) + " rating rows");
    }
    if (observed_items.empty() || observed_ratings.cols() == 0) {
        throw DegenerateInputError("personalization needs at least one observed item and one new agent");
    }
    const FeatureMatrix observed_features = selectItems(catalog, observed_items);

    PersonalizationResult result;
    result.params = fitPreferences(engine, key, observed_features, observed_ratings, config, result.report);
    result.predictions = predictAll(catalog, result.params);
    if (!result.predictions.allFinite()) {
        throw NumericAnomalyError("non-finite catalog prediction", result.report.rounds);
    }
    return result;
}
