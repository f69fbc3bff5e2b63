// src/cuda/CudaEngine.hpp
//
// Header declaring the GPU gradient backend of the
// **ParallelPreferenceEngine**.
//
// This file extends the **Strategy Design Pattern** to CUDA devices. Device
// buffers are allocated once per problem shape and reused across rounds.
//
// Mathematical context:
// • Residual signs: one thread per (item, agent),
//   \( s_{iu} = \operatorname{sign}(x_i \cdot p_u - r_{iu}) \), sign(0) = 0.
// • Gradient: one thread per (agent, feature),
//   \( g_{uk} = \frac{1}{|I||U|} \sum_i s_{iu} x_{ik} \).
// • Loss: per-entry absolute residuals reduced on the host.
//
// Only compiled when the build enables CUDA (PPE_WITH_CUDA).
#ifndef CUDA_ENGINE_HPP
#define CUDA_ENGINE_HPP
#include "../core/Engine.hpp"
#include <vector>

/**
 * @brief GPU-accelerated evaluation of the MAE loss and subgradient.
 *
 * Device buffers are sized lazily and reused while the shapes stay the
 * same; they are released in the destructor.
 */
class CudaGradientStrategy : public GradientStrategy {
public:
    CudaGradientStrategy();
    ~CudaGradientStrategy() override;
    CudaGradientStrategy(const CudaGradientStrategy&) = delete;
    CudaGradientStrategy& operator=(const CudaGradientStrategy&) = delete;

    double computeLoss(const ParameterMatrix& params, const RatingMatrix& target,
                       const FeatureMatrix& features) override;
    ParameterMatrix computeGradient(const ParameterMatrix& params, const RatingMatrix& target,
                                    const FeatureMatrix& features) override;
    std::string name() const override { return "gpu"; }

private:
    /**
     * @brief Uploads the inputs and launches the residual kernel into d_residual.
     */
    void computeResiduals(const ParameterMatrix& params, const RatingMatrix& target,
                          const FeatureMatrix& features);
    void release();

    double* d_features = nullptr;  ///< Item x F, column-major.
    double* d_target = nullptr;    ///< Item x Agent, column-major.
    double* d_params = nullptr;    ///< Agent x F, column-major.
    double* d_residual = nullptr;  ///< Item x Agent residuals.
    double* d_grad = nullptr;      ///< Agent x F gradient.
    Index items = 0;
    Index agents = 0;
    Index dims = 0;
};

#endif // CUDA_ENGINE_HPP
