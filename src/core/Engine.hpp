// src/core/Engine.hpp
//
// Gradient backends and the **OptimizationEngine** facade of the
// **ParallelPreferenceEngine**.
//
// This file applies the **Strategy Design Pattern** to the one expensive step
// of training, the evaluation of the MAE loss and its subgradient:
// • `SequentialGradientStrategy` – dense Eigen products, the reference.
// • `ThreadPoolGradientStrategy` – item-chunked partial sums on a reusable
//   `ThreadPool`.
// • `OpenMPGradientStrategy`     – agent-parallel accumulation with OpenMP.
// • `CudaGradientStrategy`       – GPU kernels (src/cuda/CudaEngine.hpp).
//
// `OptimizationEngine` is the **Facade** that owns one backend and runs the
// fixed-count gradient-descent loop
//
// \[
// P_{k+1} = P_k - \eta \, \nabla_P L(X P_k^T, R)
// \]
//
// for exactly `num_rounds` rounds. The engine never stores the parameter
// matrix: it is passed in, updated locally and returned, so the model state
// stays plain data owned by the caller.
#ifndef ENGINE_HPP
#define ENGINE_HPP
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "RandomKey.hpp"
#include "Types.hpp"

class ThreadPool;

/**
 * @brief Constants of one training run.
 *
 * Defaults reproduce the reference scenario (600 rounds at rate 0.2).
 */
struct TrainingConfig {
    int num_rounds = 600;        ///< Exact number of update rounds; no early exit.
    double learning_rate = 0.2;  ///< Fixed step size \( \eta \).
    int report_every = 100;      ///< Record the loss every k-th round; 0 disables.
    bool verbose = false;        ///< Also print recorded losses to stdout.

    /**
     * @throws std::invalid_argument on a non-positive round count, a
     *         non-finite or non-positive rate, or a negative report period.
     */
    void validate() const;
};

/**
 * @brief Diagnostics of one training run. Never consulted by the loop itself.
 */
struct TrainingReport {
    int rounds = 0;           ///< Update rounds performed.
    double time_taken = 0.0;  ///< Wall-clock seconds spent in run().
    double final_loss = 0.0;  ///< Loss of the returned parameters.
    std::vector<std::pair<int, double>> loss_history; ///< (round, loss) samples.
};

/**
 * @brief Abstract gradient backend.
 *
 * Implementations evaluate the MAE loss and its closed-form subgradient
 * (see Gradient.hpp) for a read-only parameter matrix. They must agree with
 * `maeGradient()` up to floating-point summation order.
 */
class GradientStrategy {
public:
    virtual ~GradientStrategy() = default;
    /**
     * @brief Mean absolute error of predictAll(features, params) against target.
     */
    virtual double computeLoss(const ParameterMatrix& params, const RatingMatrix& target,
                               const FeatureMatrix& features);
    /**
     * @brief Agent x F subgradient of computeLoss() with respect to params.
     */
    virtual ParameterMatrix computeGradient(const ParameterMatrix& params, const RatingMatrix& target,
                                            const FeatureMatrix& features) = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Reference backend: \( G = \operatorname{sign}(X P^T - R)^T X / (|I||U|) \).
 */
class SequentialGradientStrategy : public GradientStrategy {
public:
    ParameterMatrix computeGradient(const ParameterMatrix& params, const RatingMatrix& target,
                                    const FeatureMatrix& features) override;
    std::string name() const override { return "sequential"; }
};

/**
 * @brief Item-chunked backend on a private ThreadPool.
 *
 * Each task owns a contiguous block of item rows and returns that block's
 * partial gradient (or partial absolute-error sum). Partials are added in
 * chunk order, so results are reproducible for a fixed thread count.
 */
class ThreadPoolGradientStrategy : public GradientStrategy {
public:
    explicit ThreadPoolGradientStrategy(size_t threads = 0);
    ~ThreadPoolGradientStrategy() override;
    double computeLoss(const ParameterMatrix& params, const RatingMatrix& target,
                       const FeatureMatrix& features) override;
    ParameterMatrix computeGradient(const ParameterMatrix& params, const RatingMatrix& target,
                                    const FeatureMatrix& features) override;
    std::string name() const override { return "threadpool"; }
private:
    std::vector<std::pair<Index, Index>> chunks(Index num_items) const;
    std::unique_ptr<ThreadPool> pool;
};

/**
 * @brief OpenMP backend: agents are distributed over threads, the loss is a
 *        reduction over all Item x Agent residuals.
 */
class OpenMPGradientStrategy : public GradientStrategy {
public:
    double computeLoss(const ParameterMatrix& params, const RatingMatrix& target,
                       const FeatureMatrix& features) override;
    ParameterMatrix computeGradient(const ParameterMatrix& params, const RatingMatrix& target,
                                    const FeatureMatrix& features) override;
    std::string name() const override { return "openmp"; }
};

/**
 * @brief Facade running fixed-count gradient descent through one backend.
 *
 * Owns the strategy (deleted in the destructor). Non-copyable.
 */
class OptimizationEngine {
private:
    GradientStrategy* strategy; ///< Active backend, owned.
public:
    /**
     * @param s Heap-allocated backend; ownership is transferred.
     * @throws std::invalid_argument if `s` is null.
     */
    explicit OptimizationEngine(GradientStrategy* s);
    ~OptimizationEngine() { delete strategy; }
    OptimizationEngine(const OptimizationEngine&) = delete;
    OptimizationEngine& operator=(const OptimizationEngine&) = delete;

    /**
     * @brief Runs `config.num_rounds` descent rounds starting from `params`.
     *
     * Each round evaluates the current loss, then the gradient, then applies
     * `params -= learning_rate * gradient`. Both evaluations are checked for
     * non-finite values before the update.
     *
     * @param params Initial Agent x F parameters (copied; the caller's matrix
     *        is left untouched).
     * @param target Item x Agent observed ratings.
     * @param features Item x F item features.
     * @param config Round count, rate and reporting period.
     * @param report Output: rounds, wall-clock time, final loss, loss samples.
     * @return ParameterMatrix The finalized parameters.
     * @throws ShapeMismatchError, DegenerateInputError, NumericAnomalyError,
     *         std::invalid_argument
     */
    ParameterMatrix run(ParameterMatrix params, const RatingMatrix& target,
                        const FeatureMatrix& features, const TrainingConfig& config,
                        TrainingReport& report);

    GradientStrategy& backend() { return *strategy; }
};

/**
 * @brief Fresh Agent x F parameters with standard normal entries drawn from `key`.
 *
 * @throws DegenerateInputError if either dimension is zero or negative.
 */
ParameterMatrix initializeParameters(const RandomKey& key, Index num_agents, Index num_features);

/**
 * @brief Initializes parameters for every agent column of `target` from `key`
 *        and trains them with `engine`.
 */
ParameterMatrix fitPreferences(OptimizationEngine& engine, const RandomKey& key,
                               const FeatureMatrix& features, const RatingMatrix& target,
                               const TrainingConfig& config, TrainingReport& report);

/**
 * @brief Factory for the backends selectable by name.
 *
 * @param mode "sequential", "threadpool", "openmp" or, in CUDA builds, "gpu".
 * @return OptimizationEngine* Heap-allocated engine; the caller owns it.
 * @throws std::runtime_error for an unknown or unavailable mode.
 */
OptimizationEngine* createEngine(const std::string& mode);

#endif // ENGINE_HPP
