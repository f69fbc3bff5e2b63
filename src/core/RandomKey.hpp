// src/core/RandomKey.hpp
//
// Explicit, splittable random state for the **ParallelPreferenceEngine**.
//
// A `RandomKey` is a plain value. Drawing from a key never mutates it, so a
// key that is drawn from twice yields the same numbers twice. Independent
// streams are obtained only through `split()`, which derives two fresh keys
// from one consumed key:
//
//     auto [init_key, data_key] = split(RandomKey(42));
//
// Each draw seeds a local `std::mt19937_64` from the key, so no generator is
// shared between call sites and no global state exists.
#ifndef RANDOM_KEY_HPP
#define RANDOM_KEY_HPP
#include <cstdint>
#include <utility>
#include "Types.hpp"

/**
 * @class RandomKey
 * @brief Immutable 64-bit handle identifying one random stream.
 */
class RandomKey {
public:
    explicit RandomKey(std::uint64_t seed);
    std::uint64_t value() const { return state; }
    bool operator==(const RandomKey& other) const { return state == other.state; }
    bool operator!=(const RandomKey& other) const { return state != other.state; }
private:
    std::uint64_t state;
};

/**
 * @brief Derives two independent keys from `key`.
 *
 * The input key is considered consumed; callers must continue with the
 * returned pair only.
 */
std::pair<RandomKey, RandomKey> split(const RandomKey& key);

/**
 * @brief Draws a rows x cols matrix of standard normal values.
 */
Eigen::MatrixXd normalMatrix(const RandomKey& key, Index rows, Index cols);

/**
 * @brief Draws a rows x cols matrix of 0/1 values with P(1) = p.
 *
 * @throws std::invalid_argument if p lies outside [0, 1].
 */
Eigen::MatrixXd bernoulliMatrix(const RandomKey& key, Index rows, Index cols, double p);

#endif // RANDOM_KEY_HPP
