#include "core/agent/mlp.h"

#include <QJsonArray>

#include <algorithm>
#include <cmath>

namespace rt {

QString activationToString(Activation activation)
{
    switch (activation) {
    case Activation::Relu:   return QStringLiteral("relu");
    case Activation::Tanh:   return QStringLiteral("tanh");
    case Activation::Linear: return QStringLiteral("linear");
    }
    return QStringLiteral("linear");
}

std::optional<Activation> activationFromString(const QString& str)
{
    if (str == QLatin1String("relu"))   return Activation::Relu;
    if (str == QLatin1String("tanh"))   return Activation::Tanh;
    if (str == QLatin1String("linear")) return Activation::Linear;
    return std::nullopt;
}

Mlp::Mlp(const std::vector<int>& sizes,
         const std::vector<Activation>& activations,
         std::mt19937& rng)
{
    const size_t layerCount = sizes.size() > 1 ? sizes.size() - 1 : 0;
    m_layers.reserve(layerCount);
    for (size_t i = 0; i < layerCount; ++i) {
        const int in = std::max(sizes[i], 1);
        const int out = std::max(sizes[i + 1], 1);

        // Xavier/Glorot uniform.
        const double limit = std::sqrt(6.0 / static_cast<double>(in + out));
        std::uniform_real_distribution<double> dist(-limit, limit);

        Layer layer;
        layer.weights.resize(out, in);
        for (int r = 0; r < out; ++r) {
            for (int c = 0; c < in; ++c) {
                layer.weights(r, c) = dist(rng);
            }
        }
        layer.bias = Eigen::VectorXd::Zero(out);
        layer.activation = i < activations.size() ? activations[i] : Activation::Linear;
        m_layers.push_back(std::move(layer));
    }
}

int Mlp::inputDim() const
{
    return m_layers.empty() ? 0 : static_cast<int>(m_layers.front().weights.cols());
}

int Mlp::outputDim() const
{
    return m_layers.empty() ? 0 : static_cast<int>(m_layers.back().weights.rows());
}

Eigen::VectorXd Mlp::activate(const Eigen::VectorXd& x, Activation activation)
{
    switch (activation) {
    case Activation::Relu:
        return x.cwiseMax(0.0);
    case Activation::Tanh:
        return x.array().tanh().matrix();
    case Activation::Linear:
        break;
    }
    return x;
}

Eigen::VectorXd Mlp::activationDerivative(const Eigen::VectorXd& activated, Activation activation)
{
    switch (activation) {
    case Activation::Relu:
        return (activated.array() > 0.0).cast<double>().matrix();
    case Activation::Tanh:
        return (1.0 - activated.array().square()).matrix();
    case Activation::Linear:
        break;
    }
    return Eigen::VectorXd::Ones(activated.size());
}

Eigen::VectorXd Mlp::forward(const Eigen::VectorXd& input, ForwardCache* cache) const
{
    if (cache) {
        cache->activations.clear();
        cache->activations.reserve(m_layers.size() + 1);
        cache->activations.push_back(input);
    }

    Eigen::VectorXd current = input;
    for (const Layer& layer : m_layers) {
        current = activate(layer.weights * current + layer.bias, layer.activation);
        if (cache) {
            cache->activations.push_back(current);
        }
    }
    return current;
}

MlpGradients Mlp::zeroGradients() const
{
    MlpGradients grads;
    grads.weights.reserve(m_layers.size());
    grads.biases.reserve(m_layers.size());
    for (const Layer& layer : m_layers) {
        grads.weights.push_back(Eigen::MatrixXd::Zero(layer.weights.rows(), layer.weights.cols()));
        grads.biases.push_back(Eigen::VectorXd::Zero(layer.bias.size()));
    }
    return grads;
}

void Mlp::accumulateGradients(const ForwardCache& cache,
                              const Eigen::VectorXd& outputGrad,
                              MlpGradients* grads) const
{
    if (!grads || cache.activations.size() != m_layers.size() + 1) {
        return;
    }

    Eigen::VectorXd delta = outputGrad;
    for (int i = static_cast<int>(m_layers.size()) - 1; i >= 0; --i) {
        const Layer& layer = m_layers[static_cast<size_t>(i)];
        const Eigen::VectorXd& out = cache.activations[static_cast<size_t>(i) + 1];
        const Eigen::VectorXd& in = cache.activations[static_cast<size_t>(i)];

        const Eigen::VectorXd preGrad = delta.cwiseProduct(activationDerivative(out, layer.activation));
        grads->weights[static_cast<size_t>(i)] += preGrad * in.transpose();
        grads->biases[static_cast<size_t>(i)] += preGrad;
        delta = layer.weights.transpose() * preGrad;
    }
}

QJsonObject Mlp::toJson() const
{
    QJsonArray layers;
    for (const Layer& layer : m_layers) {
        QJsonArray weights;
        for (int r = 0; r < layer.weights.rows(); ++r) {
            for (int c = 0; c < layer.weights.cols(); ++c) {
                weights.append(layer.weights(r, c));
            }
        }
        QJsonArray bias;
        for (int i = 0; i < layer.bias.size(); ++i) {
            bias.append(layer.bias(i));
        }

        QJsonObject entry;
        entry[QStringLiteral("rows")] = static_cast<int>(layer.weights.rows());
        entry[QStringLiteral("cols")] = static_cast<int>(layer.weights.cols());
        entry[QStringLiteral("activation")] = activationToString(layer.activation);
        entry[QStringLiteral("weights")] = weights;
        entry[QStringLiteral("bias")] = bias;
        layers.append(entry);
    }

    QJsonObject json;
    json[QStringLiteral("layers")] = layers;
    return json;
}

std::optional<Mlp> Mlp::fromJson(const QJsonObject& json, QString* errorOut)
{
    auto fail = [errorOut](const QString& reason) -> std::optional<Mlp> {
        if (errorOut) {
            *errorOut = reason;
        }
        return std::nullopt;
    };

    const QJsonArray layers = json.value(QStringLiteral("layers")).toArray();
    if (layers.isEmpty()) {
        return fail(QStringLiteral("missing_layers"));
    }

    Mlp net;
    int previousOut = -1;
    for (const QJsonValue& value : layers) {
        const QJsonObject entry = value.toObject();
        const int rows = entry.value(QStringLiteral("rows")).toInt(0);
        const int cols = entry.value(QStringLiteral("cols")).toInt(0);
        const QJsonArray weights = entry.value(QStringLiteral("weights")).toArray();
        const QJsonArray bias = entry.value(QStringLiteral("bias")).toArray();
        const std::optional<Activation> activation =
            activationFromString(entry.value(QStringLiteral("activation")).toString());

        if (rows <= 0 || cols <= 0 || !activation
            || weights.size() != rows * cols || bias.size() != rows) {
            return fail(QStringLiteral("malformed_layer"));
        }
        if (previousOut >= 0 && previousOut != cols) {
            return fail(QStringLiteral("layer_shape_mismatch"));
        }

        Layer layer;
        layer.weights.resize(rows, cols);
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                layer.weights(r, c) = weights.at(r * cols + c).toDouble(0.0);
            }
        }
        layer.bias.resize(rows);
        for (int i = 0; i < rows; ++i) {
            layer.bias(i) = bias.at(i).toDouble(0.0);
        }
        layer.activation = *activation;
        net.m_layers.push_back(std::move(layer));
        previousOut = rows;
    }
    return net;
}

} // namespace rt
