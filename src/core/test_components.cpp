// src/core/test_components.cpp
//
// CTest suite for the building blocks of the ParallelPreferenceEngine:
// random keys, the predictor, the MAE loss, the closed-form subgradient,
// the engine loop and its error taxonomy, and the ranking helper.

#include "Engine.hpp"
#include "Gradient.hpp"
#include "Loss.hpp"
#include "Predictor.hpp"
#include "RandomKey.hpp"
#include "test_util.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Problem {
    FeatureMatrix features;
    RatingMatrix target;
    ParameterMatrix params;
};

// Real-valued features keep every residual well away from zero.
Problem makeProblem(unsigned int seed, Index items, Index agents, Index dims) {
    auto [a, b] = split(RandomKey(seed));
    auto [c, d] = split(a);
    Problem p;
    p.features = normalMatrix(b, items, dims);
    p.target = generateRatings(p.features, generatePreferences(c, agents, dims));
    p.params = generatePreferences(d, agents, dims);
    return p;
}

void test_random_keys() {
    RandomKey key(2024);
    auto first = split(key);
    auto again = split(key);
    check(first.first == again.first && first.second == again.second, "split is reproducible");
    check(first.first != first.second && first.first != key, "split yields distinct keys");

    const Eigen::MatrixXd x = normalMatrix(first.first, 4, 3);
    const Eigen::MatrixXd y = normalMatrix(first.first, 4, 3);
    const Eigen::MatrixXd z = normalMatrix(first.second, 4, 3);
    check(x == y, "drawing from the same key repeats the draw");
    check(x != z, "sibling keys draw different values");

    const Eigen::MatrixXd bits = bernoulliMatrix(first.second, 50, 3, 0.5);
    bool binary = true;
    for (Index i = 0; i < bits.size(); ++i) {
        binary = binary && (bits.data()[i] == 0.0 || bits.data()[i] == 1.0);
    }
    check(binary, "bernoulli draws are 0/1");
    check(bernoulliMatrix(key, 10, 2, 0.0).isZero(), "bernoulli with p = 0 is all zeros");
    expectThrow<std::invalid_argument>([&] { bernoulliMatrix(key, 2, 2, 1.5); }, "bernoulli rejects p > 1");
}

void test_predictor() {
    Vector f(3), p(3);
    f << 1.0, 0.0, 1.0;
    p << 0.5, -2.0, 1.25;
    check(std::abs(predict(f, p) - 1.75) < 1e-15, "predict is the dot product");
    expectThrow<ShapeMismatchError>([&] { predict(f, Vector::Zero(2)); }, "predict rejects length mismatch");

    const Problem prob = makeProblem(11, 7, 4, 3);
    const RatingMatrix all = predictAll(prob.features, prob.params);
    check(all.rows() == 7 && all.cols() == 4, "predictAll is Item x Agent");
    double worst = 0.0;
    for (Index i = 0; i < all.rows(); ++i) {
        for (Index u = 0; u < all.cols(); ++u) {
            const Vector fi = prob.features.row(i).transpose();
            const Vector pu = prob.params.row(u).transpose();
            worst = std::max(worst, std::abs(all(i, u) - predict(fi, pu)));
        }
    }
    check(worst < 1e-12, "predictAll scores every item against every agent", std::to_string(worst));
    expectThrow<ShapeMismatchError>([&] { predictAll(prob.features, ParameterMatrix::Zero(4, 2)); },
                                    "predictAll rejects feature dimension mismatch");
}

void test_loss() {
    const Problem prob = makeProblem(12, 9, 3, 2);
    check(meanAbsoluteError(prob.target, prob.target) == 0.0, "loss(X, X) == 0");
    const RatingMatrix predicted = predictAll(prob.features, prob.params);
    check(meanAbsoluteError(predicted, prob.target) > 0.0, "loss(A, B) > 0 when A != B");

    RatingMatrix a(2, 2), b(2, 2);
    a << 1.0, 2.0, 3.0, 4.0;
    b << 2.0, 2.0, 1.0, 4.5;
    check(std::abs(meanAbsoluteError(a, b) - 3.5 / 4.0) < 1e-15, "loss is the mean absolute difference");
    expectThrow<ShapeMismatchError>([&] { meanAbsoluteError(a, RatingMatrix::Zero(2, 3)); },
                                    "loss rejects shape mismatch");
    expectThrow<DegenerateInputError>([&] { meanAbsoluteError(RatingMatrix(0, 0), RatingMatrix(0, 0)); },
                                      "loss rejects empty matrices");
}

void test_gradient() {
    const Problem prob = makeProblem(13, 20, 4, 3);
    const ParameterMatrix closed = maeGradient(prob.params, prob.target, prob.features);
    const ParameterMatrix numeric = numericalGradient(prob.params, prob.target, prob.features, 1e-7);
    const double diff = (closed - numeric).cwiseAbs().maxCoeff();
    check(diff < 1e-6, "closed-form gradient matches finite differences", std::to_string(diff));

    // Hand-computed: two items, one agent, residuals +1 and -2.
    FeatureMatrix x(2, 2);
    x << 1.0, 0.0,
         1.0, 1.0;
    ParameterMatrix p(1, 2);
    p << 2.0, 0.0;
    RatingMatrix r(2, 1);
    r << 1.0, 4.0;
    ParameterMatrix expected(1, 2);
    expected << (1.0 - 1.0) / 2.0, (0.0 - 1.0) / 2.0;
    check((maeGradient(p, r, x) - expected).cwiseAbs().maxCoeff() < 1e-15, "gradient matches hand computation");

    // At an exact fit every residual is zero and sign(0) = 0.
    const RatingMatrix exact = predictAll(prob.features, prob.params);
    check(maeGradient(prob.params, exact, prob.features).isZero(0.0), "gradient vanishes at an exact fit");
    // Central differences straddle every kink symmetrically: the same convention.
    check(numericalGradient(prob.params, exact, prob.features).cwiseAbs().maxCoeff() < 1e-6,
          "finite differences agree with sign(0) = 0 at an exact fit");

    expectThrow<ShapeMismatchError>([&] { maeGradient(prob.params, prob.target.leftCols(3), prob.features); },
                                    "gradient rejects agent count mismatch");
    expectThrow<ShapeMismatchError>([&] { maeGradient(prob.params, prob.target.topRows(5), prob.features); },
                                    "gradient rejects item count mismatch");
    expectThrow<ShapeMismatchError>([&] { maeGradient(prob.params, prob.target, prob.features.leftCols(2)); },
                                    "gradient rejects feature dimension mismatch");
}

void test_engine() {
    const Problem prob = makeProblem(14, 30, 3, 3);
    OptimizationEngine engine(new SequentialGradientStrategy());
    TrainingConfig config;
    config.num_rounds = 250;
    config.report_every = 50;

    const ParameterMatrix start = prob.params;
    TrainingReport report;
    const ParameterMatrix fitted = engine.run(start, prob.target, prob.features, config, report);
    check(start == prob.params, "run leaves the caller's parameters untouched");
    check(report.rounds == 250, "run performs exactly num_rounds rounds");
    check(report.loss_history.size() == 6 && report.loss_history.back().first == 250,
          "loss is sampled every report_every rounds plus the final state");
    check(report.final_loss < report.loss_history.front().second, "training lowers the loss");
    check(fitted.rows() == 3 && fitted.cols() == 3 && fitted.allFinite(), "fitted parameters are finite");

    // One manual round equals one engine round.
    config.num_rounds = 1;
    const ParameterMatrix one = engine.run(prob.params, prob.target, prob.features, config, report);
    const ParameterMatrix manual = prob.params - 0.2 * maeGradient(prob.params, prob.target, prob.features);
    check((one - manual).cwiseAbs().maxCoeff() < 1e-15, "a round applies params -= rate * gradient");

    RatingMatrix poisoned = prob.target;
    poisoned(3, 1) = std::numeric_limits<double>::quiet_NaN();
    try {
        engine.run(prob.params, poisoned, prob.features, config, report);
        check(false, "non-finite loss is reported");
    } catch (const NumericAnomalyError& e) {
        check(e.round() == 0, "non-finite loss is reported", e.what());
    }

    expectThrow<DegenerateInputError>([&] {
        engine.run(ParameterMatrix::Zero(2, 3), RatingMatrix(0, 2), FeatureMatrix(0, 3), config, report);
    }, "zero items is degenerate");
    expectThrow<DegenerateInputError>([&] {
        engine.run(ParameterMatrix(0, 3), RatingMatrix(4, 0), FeatureMatrix::Ones(4, 3), config, report);
    }, "zero agents is degenerate");
    expectThrow<DegenerateInputError>([&] { initializeParameters(RandomKey(1), 0, 3); },
                                      "initializing zero agents is degenerate");
    expectThrow<ShapeMismatchError>([&] {
        engine.run(prob.params, prob.target.leftCols(2), prob.features, config, report);
    }, "run rejects mismatched shapes");

    TrainingConfig bad;
    bad.num_rounds = 0;
    expectThrow<std::invalid_argument>([&] { bad.validate(); }, "zero rounds is rejected");
    bad = TrainingConfig();
    bad.learning_rate = -0.1;
    expectThrow<std::invalid_argument>([&] { bad.validate(); }, "negative learning rate is rejected");
    bad = TrainingConfig();
    bad.report_every = -1;
    expectThrow<std::invalid_argument>([&] { bad.validate(); }, "negative report period is rejected");

    expectThrow<std::runtime_error>([] { delete createEngine("quantum"); }, "unknown backend is rejected");
}

void test_rank_items() {
    RatingMatrix predictions(5, 2);
    predictions << 0.1, 3.0,
                   0.9, 2.0,
                   0.5, 2.0,
                   0.9, 1.0,
                   -1.0, 0.0;
    check(rankItems(predictions, 0) == std::vector<Index>({1, 3, 2, 0, 4}), "ranking is descending, ties by index");
    check(rankItems(predictions, 1, {0}) == std::vector<Index>({1, 2, 3, 4}), "ranking skips excluded items");
    expectThrow<std::out_of_range>([&] { rankItems(predictions, 2); }, "ranking rejects unknown agent");

    predictions(2, 1) = std::numeric_limits<double>::quiet_NaN();
    expectThrow<std::invalid_argument>([&] { rankItems(predictions, 1); }, "ranking rejects a NaN prediction");
    check(rankItems(predictions, 0).size() == 5, "other agents still rank");
}

} // namespace

int main() {
    test_random_keys();
    test_predictor();
    test_loss();
    test_gradient();
    test_engine();
    test_rank_items();
    std::cout << "All component tests passed!" << std::endl;
    return 0;
}
