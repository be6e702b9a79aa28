#include <QtTest/QtTest>

#include "core/agent/adam_optimizer.h"
#include "core/agent/mlp.h"

#include <QJsonArray>

class TestMlp : public QObject {
    Q_OBJECT

private slots:
    void testShapes();
    void testSeededInitIsReproducible();
    void testTanhOutputIsBounded();
    void testGradientsMatchFiniteDifferences();
    void testJsonPreservesOutputs();
    void testFromJsonRejectsMalformedLayers();
    void testAdamReducesSquaredError();
};

void TestMlp::testShapes()
{
    std::mt19937 rng(7);
    const rt::Mlp net({3, 4, 2}, {rt::Activation::Relu, rt::Activation::Tanh}, rng);
    QCOMPARE(net.inputDim(), 3);
    QCOMPARE(net.outputDim(), 2);
    QCOMPARE(net.layerCount(), 2);
    QCOMPARE(int(net.layer(0).weights.rows()), 4);
    QCOMPARE(int(net.layer(0).weights.cols()), 3);
    QCOMPARE(net.layer(0).bias.norm(), 0.0);

    rt::Mlp::ForwardCache cache;
    const Eigen::VectorXd out = net.forward(Eigen::VectorXd::Ones(3), &cache);
    QCOMPARE(int(out.size()), 2);
    QCOMPARE(int(cache.activations.size()), 3);
}

void TestMlp::testSeededInitIsReproducible()
{
    std::mt19937 rngA(42);
    std::mt19937 rngB(42);
    std::mt19937 rngC(43);
    const std::vector<rt::Activation> acts = {rt::Activation::Relu, rt::Activation::Linear};
    const rt::Mlp a({5, 8, 1}, acts, rngA);
    const rt::Mlp b({5, 8, 1}, acts, rngB);
    const rt::Mlp c({5, 8, 1}, acts, rngC);

    QVERIFY(a.layer(0).weights.isApprox(b.layer(0).weights));
    QVERIFY(a.layer(1).weights.isApprox(b.layer(1).weights));
    QVERIFY(!a.layer(0).weights.isApprox(c.layer(0).weights));
}

void TestMlp::testTanhOutputIsBounded()
{
    std::mt19937 rng(3);
    const rt::Mlp net({4, 16, 3}, {rt::Activation::Relu, rt::Activation::Tanh}, rng);
    const Eigen::VectorXd out = net.forward(Eigen::VectorXd::Constant(4, 1000.0));
    for (int i = 0; i < out.size(); ++i) {
        QVERIFY(out(i) >= -1.0 && out(i) <= 1.0);
    }
}

void TestMlp::testGradientsMatchFiniteDifferences()
{
    std::mt19937 rng(11);
    rt::Mlp net({3, 5, 2}, {rt::Activation::Tanh, rt::Activation::Linear}, rng);
    net.layer(0).bias = Eigen::VectorXd::Constant(5, 0.1);

    Eigen::VectorXd input(3);
    input << 0.3, -0.7, 0.5;
    Eigen::VectorXd outputGrad(2);
    outputGrad << 1.0, -0.5;

    auto loss = [&]() { return outputGrad.dot(net.forward(input)); };

    rt::Mlp::ForwardCache cache;
    net.forward(input, &cache);
    rt::MlpGradients grads = net.zeroGradients();
    net.accumulateGradients(cache, outputGrad, &grads);

    const double eps = 1e-6;
    const struct {
        int layer;
        int row;
        int col;
    } samples[] = {{0, 1, 2}, {0, 4, 0}, {1, 0, 3}, {1, 1, 1}};

    for (const auto& p : samples) {
        double& w = net.layer(p.layer).weights(p.row, p.col);
        const double original = w;
        w = original + eps;
        const double up = loss();
        w = original - eps;
        const double down = loss();
        w = original;

        const double numeric = (up - down) / (2.0 * eps);
        const double analytic = grads.weights[static_cast<size_t>(p.layer)](p.row, p.col);
        QVERIFY2(qAbs(numeric - analytic) < 1e-5,
                 qPrintable(QStringLiteral("layer %1 (%2,%3): numeric %4 analytic %5")
                                .arg(p.layer).arg(p.row).arg(p.col).arg(numeric).arg(analytic)));
    }

    double& b = net.layer(0).bias(2);
    const double original = b;
    b = original + eps;
    const double up = loss();
    b = original - eps;
    const double down = loss();
    b = original;
    QVERIFY(qAbs((up - down) / (2.0 * eps) - grads.biases[0](2)) < 1e-5);
}

void TestMlp::testJsonPreservesOutputs()
{
    std::mt19937 rng(5);
    const rt::Mlp net({6, 10, 4}, {rt::Activation::Relu, rt::Activation::Tanh}, rng);

    QString error;
    const std::optional<rt::Mlp> restored = rt::Mlp::fromJson(net.toJson(), &error);
    QVERIFY2(restored.has_value(), qPrintable(error));
    QVERIFY(restored->layer(1).activation == rt::Activation::Tanh);

    const Eigen::VectorXd input = Eigen::VectorXd::LinSpaced(6, -1.0, 1.0);
    QVERIFY(net.forward(input).isApprox(restored->forward(input)));
}

void TestMlp::testFromJsonRejectsMalformedLayers()
{
    std::mt19937 rng(9);
    const rt::Mlp net({2, 3, 1}, {rt::Activation::Relu, rt::Activation::Linear}, rng);
    const QJsonObject good = net.toJson();

    QString error;
    QVERIFY(!rt::Mlp::fromJson(QJsonObject(), &error).has_value());
    QCOMPARE(error, QStringLiteral("missing_layers"));

    QJsonArray layers = good.value(QStringLiteral("layers")).toArray();
    QJsonObject first = layers.at(0).toObject();
    first[QStringLiteral("bias")] = QJsonArray{0.0};
    layers[0] = first;
    QJsonObject broken;
    broken[QStringLiteral("layers")] = layers;
    QVERIFY(!rt::Mlp::fromJson(broken, &error).has_value());
    QCOMPARE(error, QStringLiteral("malformed_layer"));

    layers = good.value(QStringLiteral("layers")).toArray();
    QJsonObject badActivation = layers.at(1).toObject();
    badActivation[QStringLiteral("activation")] = QStringLiteral("softmax");
    layers[1] = badActivation;
    broken[QStringLiteral("layers")] = layers;
    QVERIFY(!rt::Mlp::fromJson(broken, &error).has_value());
    QCOMPARE(error, QStringLiteral("malformed_layer"));

    // Two copies of the 2 -> 3 layer do not chain.
    layers = good.value(QStringLiteral("layers")).toArray();
    layers[1] = layers.at(0);
    broken[QStringLiteral("layers")] = layers;
    QVERIFY(!rt::Mlp::fromJson(broken, &error).has_value());
    QCOMPARE(error, QStringLiteral("layer_shape_mismatch"));
}

void TestMlp::testAdamReducesSquaredError()
{
    std::mt19937 rng(1);
    rt::Mlp net({2, 1}, {rt::Activation::Linear}, rng);
    rt::AdamOptimizer optimizer(0.05);

    Eigen::VectorXd input(2);
    input << 1.0, 1.0;
    const double target = 1.5;

    auto squaredError = [&]() {
        const double diff = net.forward(input)(0) - target;
        return diff * diff;
    };

    const double before = squaredError();
    for (int i = 0; i < 200; ++i) {
        rt::Mlp::ForwardCache cache;
        const Eigen::VectorXd out = net.forward(input, &cache);
        Eigen::VectorXd grad(1);
        grad(0) = 2.0 * (out(0) - target);
        rt::MlpGradients grads = net.zeroGradients();
        net.accumulateGradients(cache, grad, &grads);
        optimizer.step(net, grads);
    }

    QCOMPARE(optimizer.stepCount(), 200LL);
    QVERIFY(squaredError() < 1e-2);
    QVERIFY(squaredError() < before);

    optimizer.reset();
    QCOMPARE(optimizer.stepCount(), 0LL);
}

QTEST_MAIN(TestMlp)
#include "test_mlp.moc"
