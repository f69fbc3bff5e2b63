// src/core/RandomKey.cpp
//
// Implementation of the splittable random key.
//
// Splitting hashes the parent state with two distinct stream constants
// through the SplitMix64 finalizer, which maps nearby inputs to unrelated
// outputs. Draws seed a local Mersenne Twister from the key value and fill
// the matrix in column-major order, so a given (key, shape) pair always
// produces the same matrix on one standard library implementation.
#include "RandomKey.hpp"
#include <random>
#include <stdexcept>

namespace {

std::uint64_t mix(std::uint64_t z) {
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

void checkShape(Index rows, Index cols) {
    if (rows < 0 || cols < 0) {
        throw std::invalid_argument("random matrix dimensions must be non-negative");
    }
}

} // namespace

RandomKey::RandomKey(std::uint64_t seed) : state(mix(seed)) {}

std::pair<RandomKey, RandomKey> split(const RandomKey& key) {
    // Children are built from raw hashed states; the constructor mixes once more.
    const std::uint64_t left = mix(key.value() ^ 0x243F6A8885A308D3ULL);
    const std::uint64_t right = mix(key.value() ^ 0x13198A2E03707344ULL);
    return {RandomKey(left), RandomKey(right)};
}

Eigen::MatrixXd normalMatrix(const RandomKey& key, Index rows, Index cols) {
    checkShape(rows, cols);
    std::mt19937_64 gen(key.value());
    std::normal_distribution<double> dist(0.0, 1.0);
    Eigen::MatrixXd out(rows, cols);
    for (Index i = 0; i < out.size(); ++i) {
        out.data()[i] = dist(gen);
    }
    return out;
}

Eigen::MatrixXd bernoulliMatrix(const RandomKey& key, Index rows, Index cols, double p) {
    checkShape(rows, cols);
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument("bernoulli probability must lie in [0, 1]");
    }
    std::mt19937_64 gen(key.value());
    std::bernoulli_distribution dist(p);
    Eigen::MatrixXd out(rows, cols);
    for (Index i = 0; i < out.size(); ++i) {
        out.data()[i] = dist(gen) ? 1.0 : 0.0;
    }
    return out;
}
