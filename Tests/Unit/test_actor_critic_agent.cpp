#include <QtTest/QtTest>

#include "core/agent/actor_critic_agent.h"
#include "core/environment/reading_environment.h"

#include <QTemporaryDir>

namespace {

rt::ActorCriticAgent::Config smallConfig()
{
    rt::ActorCriticAgent::Config config;
    config.hiddenDim = 16;
    config.seed = 99;
    return config;
}

rt::StateVector stateWith(double first)
{
    rt::StateVector state(rt::kDefaultStateDim, 0.0);
    for (int i = 0; i < rt::kSemanticFeatureCount; ++i) {
        state[i] = 0.5;
    }
    state[0] = first;
    return state;
}

} // namespace

class TestActorCriticAgent : public QObject {
    Q_OBJECT

private slots:
    void testDeterministicActionIsBounded();
    void testSameSeedSameAction();
    void testStochasticActionAddsNoise();
    void testNoisyActionIsNotClipped();
    void testRejectsWrongStateDimension();
    void testNStepTargets();
    void testEmptyTrainingIsNoOp();
    void testTrainRejectsMismatchedInput();
    void testBaselineLossDecreases();
    void testSaveLoadRestoresPolicy();
    void testLoadRejectsOtherShapes();
    void testRunEpisodeAgainstEnvironment();
};

void TestActorCriticAgent::testDeterministicActionIsBounded()
{
    rt::ActorCriticAgent agent(smallConfig());
    const rt::StateVector state = stateWith(0.9);

    const std::optional<rt::ActionSample> first = agent.getAction(state, false);
    const std::optional<rt::ActionSample> second = agent.getAction(state, false);
    QVERIFY(first.has_value());
    QVERIFY(second.has_value());
    QCOMPARE(int(first->rawAction.size()), rt::kDefaultActionDim);
    QCOMPARE(first->action, first->rawAction);
    QCOMPARE(first->rawAction, second->rawAction);
    for (double component : first->rawAction) {
        QVERIFY(component >= -1.0 && component <= 1.0);
    }
}

void TestActorCriticAgent::testSameSeedSameAction()
{
    rt::ActorCriticAgent a(smallConfig());
    rt::ActorCriticAgent b(smallConfig());
    const rt::StateVector state = stateWith(0.2);
    QCOMPARE(a.getAction(state, false)->rawAction, b.getAction(state, false)->rawAction);

    rt::ActorCriticAgent::Config other = smallConfig();
    other.seed = 100;
    rt::ActorCriticAgent c(other);
    QVERIFY(a.getAction(state, false)->rawAction != c.getAction(state, false)->rawAction);
}

void TestActorCriticAgent::testStochasticActionAddsNoise()
{
    rt::ActorCriticAgent agent(smallConfig());
    const std::optional<rt::ActionSample> sample = agent.getAction(stateWith(0.5), true);
    QVERIFY(sample.has_value());
    QCOMPARE(int(sample->action.size()), rt::kDefaultActionDim);
    QVERIFY(sample->action != sample->rawAction);
}

void TestActorCriticAgent::testNoisyActionIsNotClipped()
{
    rt::ActorCriticAgent::Config config = smallConfig();
    config.explorationNoise = 5.0;
    rt::ActorCriticAgent agent(config);

    const std::optional<rt::ActionSample> sample = agent.getAction(stateWith(0.5), true);
    QVERIFY(sample.has_value());
    bool outside = false;
    for (int i = 0; i < sample->action.size(); ++i) {
        QVERIFY(qAbs(sample->rawAction.at(i)) <= 1.0);
        outside = outside || qAbs(sample->action.at(i)) > 1.0;
    }
    // Exploration noise rides on top of the bounded actor output; the
    // setting maps clamp it later.
    QVERIFY(outside);

    const rt::ControlSettings mapped = rt::controlSettingsFromAction(sample->action);
    QVERIFY(rt::kReadingSpeedRange.contains(mapped.readingSpeed));
    QVERIFY(rt::kChunkSizeRange.contains(mapped.chunkSize));
}

void TestActorCriticAgent::testRejectsWrongStateDimension()
{
    rt::ActorCriticAgent agent(smallConfig());
    QString error;
    QVERIFY(!agent.getAction(rt::StateVector(5, 0.0), false, &error).has_value());
    QCOMPARE(error, QStringLiteral("state_dimension_mismatch"));

    error.clear();
    QVERIFY(!agent.value(rt::StateVector(25, 0.0), &error).has_value());
    QCOMPARE(error, QStringLiteral("state_dimension_mismatch"));
}

void TestActorCriticAgent::testNStepTargets()
{
    const QVector<double> rewards = {1.0, 1.0, 1.0};
    const QVector<double> values = {0.5, 0.5, 0.5};

    const QVector<double> oneStep = rt::ActorCriticAgent::nStepTargets(rewards, values, 0.9, 1);
    QCOMPARE(int(oneStep.size()), 3);
    QVERIFY(qAbs(oneStep[0] - 1.45) < 1e-12);
    QVERIFY(qAbs(oneStep[1] - 1.45) < 1e-12);
    QVERIFY(qAbs(oneStep[2] - 1.0) < 1e-12);

    const QVector<double> twoStep = rt::ActorCriticAgent::nStepTargets(rewards, values, 0.9, 2);
    QVERIFY(qAbs(twoStep[0] - (1.0 + 0.9 + 0.81 * 0.5)) < 1e-12);
    QVERIFY(qAbs(twoStep[1] - 1.9) < 1e-12);
    QVERIFY(qAbs(twoStep[2] - 1.0) < 1e-12);

    // A horizon past the end is a plain discounted return.
    const QVector<double> longStep = rt::ActorCriticAgent::nStepTargets(rewards, values, 0.9, 10);
    QVERIFY(qAbs(longStep[0] - 2.71) < 1e-12);

    QVERIFY(rt::ActorCriticAgent::nStepTargets({}, {}, 0.9, 1).isEmpty());
}

void TestActorCriticAgent::testEmptyTrainingIsNoOp()
{
    rt::ActorCriticAgent agent(smallConfig());
    const rt::StateVector state = stateWith(0.4);
    const rt::ActionVector before = agent.getAction(state, false)->rawAction;

    const std::optional<rt::TrainLosses> losses = agent.train({}, {}, {});
    QVERIFY(losses.has_value());
    QCOMPARE(losses->steps, 0);
    QCOMPARE(losses->policyLoss, 0.0);
    QCOMPARE(losses->baselineLoss, 0.0);
    QCOMPARE(agent.trainingUpdates(), 0LL);
    QCOMPARE(agent.getAction(state, false)->rawAction, before);
}

void TestActorCriticAgent::testTrainRejectsMismatchedInput()
{
    rt::ActorCriticAgent agent(smallConfig());
    const rt::ActionVector action(rt::kDefaultActionDim, 0.0);
    QString error;

    QVERIFY(!agent.train({stateWith(0.1), stateWith(0.2)}, {action}, {1.0, 1.0}, &error));
    QCOMPARE(error, QStringLiteral("trajectory_length_mismatch"));

    QVERIFY(!agent.train({rt::StateVector(3, 0.0)}, {action}, {1.0}, &error));
    QCOMPARE(error, QStringLiteral("state_dimension_mismatch"));

    QVERIFY(!agent.train({stateWith(0.1)}, {rt::ActionVector(2, 0.0)}, {1.0}, &error));
    QCOMPARE(error, QStringLiteral("action_dimension_mismatch"));

    QCOMPARE(agent.trainingUpdates(), 0LL);
}

void TestActorCriticAgent::testBaselineLossDecreases()
{
    rt::ActorCriticAgent::Config config = smallConfig();
    config.gamma = 0.9;
    config.nStep = 8;  // covers the whole trajectory, so targets do not move
    config.criticLearningRate = 1e-2;
    config.actorLearningRate = 1e-3;
    rt::ActorCriticAgent agent(config);

    const QVector<rt::StateVector> states = {stateWith(0.0), stateWith(0.25), stateWith(0.5), stateWith(0.75)};
    const QVector<rt::ActionVector> actions(4, rt::ActionVector(rt::kDefaultActionDim, 0.1));
    const QVector<double> rewards = {1.0, 0.5, 2.0, 0.0};

    QString error;
    const std::optional<rt::TrainLosses> first = agent.train(states, actions, rewards, &error);
    QVERIFY2(first.has_value(), qPrintable(error));
    QCOMPARE(first->steps, 4);

    std::optional<rt::TrainLosses> last;
    for (int i = 0; i < 300; ++i) {
        last = agent.train(states, actions, rewards, &error);
        QVERIFY2(last.has_value(), qPrintable(error));
    }

    QVERIFY(last->baselineLoss < first->baselineLoss * 0.5);
    QCOMPARE(agent.trainingUpdates(), 301LL);
}

void TestActorCriticAgent::testSaveLoadRestoresPolicy()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.filePath(QStringLiteral("models/actor_critic.json"));

    rt::ActorCriticAgent trained(smallConfig());
    const QVector<rt::StateVector> states = {stateWith(0.1), stateWith(0.6)};
    const QVector<rt::ActionVector> actions(2, rt::ActionVector(rt::kDefaultActionDim, 0.3));
    QVERIFY(trained.train(states, actions, {1.0, 2.0}).has_value());

    QString error;
    QVERIFY2(trained.save(path, &error), qPrintable(error));
    QVERIFY(QFile::exists(path));

    rt::ActorCriticAgent::Config other = smallConfig();
    other.seed = 4242;
    rt::ActorCriticAgent restored(other);
    QVERIFY2(restored.load(path, &error), qPrintable(error));
    QCOMPARE(restored.trainingUpdates(), 1LL);

    const rt::StateVector input = stateWith(0.33);
    const rt::ActionVector expected = trained.getAction(input, false)->rawAction;
    const rt::ActionVector actual = restored.getAction(input, false)->rawAction;
    for (int i = 0; i < expected.size(); ++i) {
        QVERIFY(qAbs(expected[i] - actual[i]) < 1e-9);
    }
    QVERIFY(qAbs(*trained.value(input) - *restored.value(input)) < 1e-9);
}

void TestActorCriticAgent::testLoadRejectsOtherShapes()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString path = tempDir.filePath(QStringLiteral("weights.json"));

    rt::ActorCriticAgent agent(smallConfig());
    QString error;
    QVERIFY(!agent.load(path, &error));
    QCOMPARE(error, QStringLiteral("not_found"));

    QVERIFY(agent.save(path, &error));

    rt::ActorCriticAgent::Config narrow = smallConfig();
    narrow.stateDim = 16;
    rt::ActorCriticAgent other(narrow);
    QVERIFY(!other.load(path, &error));
    QCOMPARE(error, QStringLiteral("dimension_mismatch"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{ not json");
    file.close();
    QVERIFY(!agent.load(path, &error));
    QVERIFY(error.startsWith(QStringLiteral("parse_error")));
}

void TestActorCriticAgent::testRunEpisodeAgainstEnvironment()
{
    rt::ReadingEnvironment env(rt::kDefaultStateDim, 2);
    rt::ActorCriticAgent agent(smallConfig());

    const rt::Episode capped = agent.runEpisode(env, 10, true);
    // Done fires once the step count exceeds 2.
    QCOMPARE(capped.length(), 3);
    QCOMPARE(int(capped.states.size()), 3);
    QCOMPARE(int(capped.actions.size()), 3);

    const rt::Episode shortEpisode = agent.runEpisode(env, 1, false);
    QCOMPARE(shortEpisode.length(), 1);

    const QVector<rt::TrainLosses> history = agent.trainOnEnvironment(env, 2, 3);
    QCOMPARE(int(history.size()), 3);
    QCOMPARE(agent.trainingUpdates(), 3LL);
    for (const rt::TrainLosses& losses : history) {
        QCOMPARE(losses.steps, 2);
    }
}

QTEST_MAIN(TestActorCriticAgent)
#include "test_actor_critic_agent.moc"
