#pragma once

#include <Eigen/Dense>

#include <QJsonObject>
#include <QString>

#include <optional>
#include <random>
#include <vector>

namespace rt {

enum class Activation {
    Relu,
    Tanh,
    Linear,
};

QString activationToString(Activation activation);
std::optional<Activation> activationFromString(const QString& str);

// Per-parameter gradients with the same shapes as the network's layers.
struct MlpGradients {
    std::vector<Eigen::MatrixXd> weights;
    std::vector<Eigen::VectorXd> biases;
};

// Fully connected feed-forward network. Layer i maps sizes[i] -> sizes[i+1].
class Mlp {
public:
    struct Layer {
        Eigen::MatrixXd weights;  // out x in
        Eigen::VectorXd bias;
        Activation activation = Activation::Linear;
    };

    // Activated outputs of every layer, input first.
    struct ForwardCache {
        std::vector<Eigen::VectorXd> activations;
    };

    Mlp(const std::vector<int>& sizes,
        const std::vector<Activation>& activations,
        std::mt19937& rng);

    int inputDim() const;
    int outputDim() const;
    int layerCount() const { return static_cast<int>(m_layers.size()); }
    const Layer& layer(int index) const { return m_layers.at(static_cast<size_t>(index)); }
    Layer& layer(int index) { return m_layers.at(static_cast<size_t>(index)); }

    Eigen::VectorXd forward(const Eigen::VectorXd& input, ForwardCache* cache = nullptr) const;

    MlpGradients zeroGradients() const;

    // Adds dLoss/dParams for one sample into grads, given dLoss/dOutput.
    void accumulateGradients(const ForwardCache& cache,
                             const Eigen::VectorXd& outputGrad,
                             MlpGradients* grads) const;

    QJsonObject toJson() const;
    static std::optional<Mlp> fromJson(const QJsonObject& json, QString* errorOut = nullptr);

private:
    Mlp() = default;

    static Eigen::VectorXd activate(const Eigen::VectorXd& x, Activation activation);
    static Eigen::VectorXd activationDerivative(const Eigen::VectorXd& activated,
                                                Activation activation);

    std::vector<Layer> m_layers;
};

} // namespace rt
