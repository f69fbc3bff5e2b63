// src/core/Engine.cpp
//
// Implements the **OptimizationEngine** facade and the CPU gradient backends
// of the **ParallelPreferenceEngine**.
//
// This file provides:
// • `OptimizationEngine::run`, the fixed-count descent loop with loss
//   sampling, non-finite detection and wall-clock timing.
// • The sequential, ThreadPool and OpenMP implementations of the MAE
//   subgradient \( G = S^T X / (|I||U|) \) with \( S = \operatorname{sign}(X P^T - R) \).
// • Parameter initialization and the `fitPreferences` convenience wrapper.
// • The backend factory used by tests and the Python bindings.
//
// The loop is sequential; only the per-round loss and gradient evaluations
// are parallel. Backends read the parameter matrix and never write it.
#include "Engine.hpp"
#include "Gradient.hpp"
#include "Loss.hpp"
#include "Predictor.hpp"
#include "ThreadPool.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>
#ifdef PPE_WITH_CUDA
#include "../cuda/CudaEngine.hpp"
#endif

void TrainingConfig::validate() const {
    if (num_rounds <= 0) {
        throw std::invalid_argument("num_rounds must be positive, got " + std::to_string(num_rounds));
    }
    if (!std::isfinite(learning_rate) || learning_rate <= 0.0) {
        throw std::invalid_argument("learning_rate must be a positive finite number");
    }
    if (report_every < 0) {
        throw std::invalid_argument("report_every must be non-negative, got " + std::to_string(report_every));
    }
}

/* ============================== ENGINE ============================== */

OptimizationEngine::OptimizationEngine(GradientStrategy* s) : strategy(s) {
    if (strategy == nullptr) {
        throw std::invalid_argument("OptimizationEngine requires a gradient strategy");
    }
}

/**
 * @brief Fixed-count gradient descent.
 *
 * Round k evaluates \( L_k = L(X P_k^T, R) \) and \( G_k \), then sets
 * \( P_{k+1} = P_k - \eta G_k \). There is no convergence test: with the
 * subgradient's sign discontinuity the loss typically settles into a
 * two-value oscillation instead of decaying to zero, and the loop simply
 * runs out its round budget.
 */
ParameterMatrix OptimizationEngine::run(ParameterMatrix params, const RatingMatrix& target,
                                        const FeatureMatrix& features, const TrainingConfig& config,
                                        TrainingReport& report) {
    config.validate();
    checkGradientShapes(params, target, features);
    if (features.rows() == 0) {
        throw DegenerateInputError("no items to train on");
    }
    if (params.rows() == 0) {
        throw DegenerateInputError("no agents to train");
    }

    auto start = std::chrono::high_resolution_clock::now();
    report = TrainingReport();
    for (int round = 0; round < config.num_rounds; ++round) {
        const double loss = strategy->computeLoss(params, target, features);
        if (!std::isfinite(loss)) {
            throw NumericAnomalyError("loss is " + std::to_string(loss), round);
        }
        if (config.report_every > 0 && round % config.report_every == 0) {
            report.loss_history.emplace_back(round, loss);
            if (config.verbose) {
                std::cout << "[" << strategy->name() << "] round " << round << ": loss = " << loss << std::endl;
            }
        }
        const ParameterMatrix grad = strategy->computeGradient(params, target, features);
        if (!grad.allFinite()) {
            throw NumericAnomalyError("gradient has non-finite entries", round);
        }
        params -= config.learning_rate * grad;
        ++report.rounds;
    }

    report.final_loss = strategy->computeLoss(params, target, features);
    if (!std::isfinite(report.final_loss) || !params.allFinite()) {
        throw NumericAnomalyError("parameters diverged", config.num_rounds);
    }
    report.loss_history.emplace_back(config.num_rounds, report.final_loss);
    if (config.verbose) {
        std::cout << "[" << strategy->name() << "] final loss after " << config.num_rounds
                  << " rounds = " << report.final_loss << std::endl;
    }
    auto end = std::chrono::high_resolution_clock::now();
    report.time_taken = std::chrono::duration<double>(end - start).count();
    return params;
}

ParameterMatrix initializeParameters(const RandomKey& key, Index num_agents, Index num_features) {
    if (num_agents <= 0 || num_features <= 0) {
        throw DegenerateInputError("cannot initialize " + std::to_string(num_agents) + "x" +
                                   std::to_string(num_features) + " parameters");
    }
    return normalMatrix(key, num_agents, num_features);
}

ParameterMatrix fitPreferences(OptimizationEngine& engine, const RandomKey& key,
                               const FeatureMatrix& features, const RatingMatrix& target,
                               const TrainingConfig& config, TrainingReport& report) {
    if (target.cols() == 0 || features.rows() == 0) {
        throw DegenerateInputError("fitPreferences needs at least one item and one agent");
    }
    ParameterMatrix params = initializeParameters(key, target.cols(), features.cols());
    return engine.run(std::move(params), target, features, config, report);
}

/* ============================== STRATEGIES ============================== */

double GradientStrategy::computeLoss(const ParameterMatrix& params, const RatingMatrix& target,
                                     const FeatureMatrix& features) {
    return meanAbsoluteError(predictAll(features, params), target);
}

ParameterMatrix SequentialGradientStrategy::computeGradient(const ParameterMatrix& params,
                                                            const RatingMatrix& target,
                                                            const FeatureMatrix& features) {
    return maeGradient(params, target, features);
}

ThreadPoolGradientStrategy::ThreadPoolGradientStrategy(size_t threads)
    : pool(new ThreadPool(threads == 0 ? std::max(1u, std::thread::hardware_concurrency())
                                       : threads)) {}

// Out of line so that ThreadPool is complete where unique_ptr deletes it.
ThreadPoolGradientStrategy::~ThreadPoolGradientStrategy() = default;

std::vector<std::pair<Index, Index>> ThreadPoolGradientStrategy::chunks(Index num_items) const {
    const Index workers = static_cast<Index>(pool->thread_count());
    const Index chunk_size = (num_items + workers - 1) / workers;
    std::vector<std::pair<Index, Index>> out;
    for (Index begin = 0; begin < num_items; begin += chunk_size) {
        out.emplace_back(begin, std::min(chunk_size, num_items - begin));
    }
    return out;
}

double ThreadPoolGradientStrategy::computeLoss(const ParameterMatrix& params, const RatingMatrix& target,
                                               const FeatureMatrix& features) {
    checkGradientShapes(params, target, features);
    if (target.size() == 0) {
        throw DegenerateInputError("loss over an empty rating matrix");
    }
    std::vector<std::future<double>> partials;
    for (const auto& chunk : chunks(features.rows())) {
        const Index begin = chunk.first;
        const Index rows = chunk.second;
        partials.push_back(pool->enqueue([&params, &target, &features, begin, rows]() {
            const RatingMatrix residual =
                features.middleRows(begin, rows) * params.transpose() - target.middleRows(begin, rows);
            return residual.cwiseAbs().sum();
        }));
    }
    // Tasks capture the inputs by reference; let all of them finish first.
    for (auto& partial : partials) partial.wait();
    double total = 0.0;
    for (auto& partial : partials) {
        total += partial.get();
    }
    return total / static_cast<double>(target.size());
}

ParameterMatrix ThreadPoolGradientStrategy::computeGradient(const ParameterMatrix& params,
                                                            const RatingMatrix& target,
                                                            const FeatureMatrix& features) {
    checkGradientShapes(params, target, features);
    if (target.size() == 0) {
        throw DegenerateInputError("gradient needs at least one item and one agent");
    }
    std::vector<std::future<ParameterMatrix>> partials;
    for (const auto& chunk : chunks(features.rows())) {
        const Index begin = chunk.first;
        const Index rows = chunk.second;
        partials.push_back(pool->enqueue([&params, &target, &features, begin, rows]() {
            const auto block = features.middleRows(begin, rows);
            const RatingMatrix signs =
                (block * params.transpose() - target.middleRows(begin, rows)).cwiseSign();
            ParameterMatrix partial = signs.transpose() * block;
            return partial;
        }));
    }
    for (auto& partial : partials) partial.wait();
    ParameterMatrix grad = ParameterMatrix::Zero(params.rows(), params.cols());
    for (auto& partial : partials) {
        grad += partial.get();
    }
    return grad / static_cast<double>(target.size());
}

double OpenMPGradientStrategy::computeLoss(const ParameterMatrix& params, const RatingMatrix& target,
                                           const FeatureMatrix& features) {
    const RatingMatrix predicted = predictAll(features, params);
    checkSameShape(predicted, target);
    if (target.size() == 0) {
        throw DegenerateInputError("loss over an empty rating matrix");
    }
    const Index n = target.size();
    const double* p = predicted.data();
    const double* t = target.data();
    double total = 0.0;
#pragma omp parallel for reduction(+:total)
    for (Index i = 0; i < n; ++i) {
        total += std::abs(p[i] - t[i]);
    }
    return total / static_cast<double>(n);
}

ParameterMatrix OpenMPGradientStrategy::computeGradient(const ParameterMatrix& params,
                                                        const RatingMatrix& target,
                                                        const FeatureMatrix& features) {
    checkGradientShapes(params, target, features);
    if (target.size() == 0) {
        throw DegenerateInputError("gradient needs at least one item and one agent");
    }
    const RatingMatrix residual = predictAll(features, params) - target;
    const Index num_items = features.rows();
    const Index num_agents = params.rows();
    const double scale = 1.0 / static_cast<double>(target.size());
    ParameterMatrix grad = ParameterMatrix::Zero(num_agents, params.cols());
    // Each thread owns whole gradient rows, so no reduction on grad is needed.
#pragma omp parallel for schedule(static)
    for (Index u = 0; u < num_agents; ++u) {
        for (Index i = 0; i < num_items; ++i) {
            const double r = residual(i, u);
            if (r > 0.0) {
                grad.row(u) += features.row(i);
            } else if (r < 0.0) {
                grad.row(u) -= features.row(i);
            }
        }
        grad.row(u) *= scale;
    }
    return grad;
}

/* ============================== FACTORY ============================== */

OptimizationEngine* createEngine(const std::string& mode) {
    GradientStrategy* strategy = nullptr;
    if (mode == "sequential") {
        strategy = new SequentialGradientStrategy();
    } else if (mode == "threadpool") {
        strategy = new ThreadPoolGradientStrategy();
    } else if (mode == "openmp") {
        strategy = new OpenMPGradientStrategy();
#ifdef PPE_WITH_CUDA
    } else if (mode == "gpu") {
        strategy = new CudaGradientStrategy();
#endif
    }
    if (strategy == nullptr) {
        throw std::runtime_error("Unknown or unavailable gradient backend: " + mode);
    }
    return new OptimizationEngine(strategy);
}
