#include "core/agent/adam_optimizer.h"

#include <cmath>

namespace rt {

AdamOptimizer::AdamOptimizer(double learningRate, double beta1, double beta2, double epsilon)
    : m_learningRate(learningRate)
    , m_beta1(beta1)
    , m_beta2(beta2)
    , m_epsilon(epsilon)
{
}

void AdamOptimizer::reset()
{
    m_t = 0;
    m_mWeights.clear();
    m_vWeights.clear();
    m_mBiases.clear();
    m_vBiases.clear();
}

void AdamOptimizer::ensureShapes(const Mlp& net)
{
    bool matches = static_cast<int>(m_mWeights.size()) == net.layerCount();
    for (int i = 0; matches && i < net.layerCount(); ++i) {
        const Mlp::Layer& layer = net.layer(i);
        matches = m_mWeights[static_cast<size_t>(i)].rows() == layer.weights.rows()
            && m_mWeights[static_cast<size_t>(i)].cols() == layer.weights.cols();
    }
    if (matches) {
        return;
    }

    reset();
    for (int i = 0; i < net.layerCount(); ++i) {
        const Mlp::Layer& layer = net.layer(i);
        m_mWeights.push_back(Eigen::MatrixXd::Zero(layer.weights.rows(), layer.weights.cols()));
        m_vWeights.push_back(Eigen::MatrixXd::Zero(layer.weights.rows(), layer.weights.cols()));
        m_mBiases.push_back(Eigen::VectorXd::Zero(layer.bias.size()));
        m_vBiases.push_back(Eigen::VectorXd::Zero(layer.bias.size()));
    }
}

void AdamOptimizer::step(Mlp& net, const MlpGradients& grads)
{
    if (static_cast<int>(grads.weights.size()) != net.layerCount()
        || static_cast<int>(grads.biases.size()) != net.layerCount()) {
        return;
    }

    ensureShapes(net);
    ++m_t;
    const double correction1 = 1.0 - std::pow(m_beta1, static_cast<double>(m_t));
    const double correction2 = 1.0 - std::pow(m_beta2, static_cast<double>(m_t));

    for (int i = 0; i < net.layerCount(); ++i) {
        const size_t idx = static_cast<size_t>(i);
        Mlp::Layer& layer = net.layer(i);

        m_mWeights[idx] = m_beta1 * m_mWeights[idx] + (1.0 - m_beta1) * grads.weights[idx];
        m_vWeights[idx] = m_beta2 * m_vWeights[idx]
            + (1.0 - m_beta2) * grads.weights[idx].cwiseProduct(grads.weights[idx]);
        const Eigen::MatrixXd mHatW = m_mWeights[idx] / correction1;
        const Eigen::MatrixXd vHatW = m_vWeights[idx] / correction2;
        layer.weights.array() -= m_learningRate * mHatW.array() / (vHatW.array().sqrt() + m_epsilon);

        m_mBiases[idx] = m_beta1 * m_mBiases[idx] + (1.0 - m_beta1) * grads.biases[idx];
        m_vBiases[idx] = m_beta2 * m_vBiases[idx]
            + (1.0 - m_beta2) * grads.biases[idx].cwiseProduct(grads.biases[idx]);
        const Eigen::VectorXd mHatB = m_mBiases[idx] / correction1;
        const Eigen::VectorXd vHatB = m_vBiases[idx] / correction2;
        layer.bias.array() -= m_learningRate * mHatB.array() / (vHatB.array().sqrt() + m_epsilon);
    }
}

} // namespace rt
