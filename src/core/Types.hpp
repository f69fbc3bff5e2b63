// src/core/Types.hpp
//
// Shared matrix aliases and the error taxonomy of the
// **ParallelPreferenceEngine**.
//
// All model state is plain dense data:
//   • FeatureMatrix   Item x F   fixed item features (boolean stored as 0/1)
//   • ParameterMatrix Agent x F  preference vectors, the only mutable state
//   • RatingMatrix    Item x Agent observed or predicted ratings
//
// The aliases resolve to `Eigen::MatrixXd` so that batched prediction and the
// closed-form gradient are single dense products, and so the Python bindings
// can hand the same buffers to NumPy.
#ifndef TYPES_HPP
#define TYPES_HPP
#include <Eigen/Dense>
#include <stdexcept>
#include <string>

using FeatureMatrix = Eigen::MatrixXd;
using ParameterMatrix = Eigen::MatrixXd;
using RatingMatrix = Eigen::MatrixXd;
using Vector = Eigen::VectorXd;
using Index = Eigen::Index;

/**
 * @brief Raised when feature dimension, item count or agent count disagree
 *        between the arguments of a prediction, loss or gradient call.
 */
class ShapeMismatchError : public std::runtime_error {
public:
    explicit ShapeMismatchError(const std::string& what)
        : std::runtime_error("shape mismatch: " + what) {}
};

/**
 * @brief Raised when a computation receives zero items or zero agents.
 */
class DegenerateInputError : public std::runtime_error {
public:
    explicit DegenerateInputError(const std::string& what)
        : std::runtime_error("degenerate input: " + what) {}
};

/**
 * @brief Raised when the loss or the gradient stops being finite.
 *
 * Carries the optimization round at which the anomaly was observed so a
 * diverging learning rate can be diagnosed from the message alone.
 */
class NumericAnomalyError : public std::runtime_error {
public:
    NumericAnomalyError(const std::string& what, int round)
        : std::runtime_error("numeric anomaly in round " + std::to_string(round) + ": " + what),
          round_(round) {}
    int round() const { return round_; }
private:
    int round_;
};

#endif // TYPES_HPP
