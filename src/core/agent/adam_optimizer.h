#pragma once

#include "core/agent/mlp.h"

#include <Eigen/Dense>

#include <vector>

namespace rt {

// Adam over the parameters of one Mlp. Moments are sized on the first step.
class AdamOptimizer {
public:
    explicit AdamOptimizer(double learningRate = 1e-3,
                           double beta1 = 0.9,
                           double beta2 = 0.999,
                           double epsilon = 1e-8);

    void step(Mlp& net, const MlpGradients& grads);
    void reset();

    double learningRate() const { return m_learningRate; }
    long long stepCount() const { return m_t; }

private:
    void ensureShapes(const Mlp& net);

    double m_learningRate;
    double m_beta1;
    double m_beta2;
    double m_epsilon;
    long long m_t = 0;

    std::vector<Eigen::MatrixXd> m_mWeights;
    std::vector<Eigen::MatrixXd> m_vWeights;
    std::vector<Eigen::VectorXd> m_mBiases;
    std::vector<Eigen::VectorXd> m_vBiases;
};

} // namespace rt
