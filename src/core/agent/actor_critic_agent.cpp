#include "core/agent/actor_critic_agent.h"

#include "core/environment/reading_environment.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <cmath>

namespace rt {

namespace {

constexpr int kWeightsFormatVersion = 1;

std::vector<int> actorSizes(const ActorCriticAgent::Config& c)
{
    return {c.stateDim, c.hiddenDim, c.hiddenDim, c.actionDim};
}

std::vector<int> criticSizes(const ActorCriticAgent::Config& c)
{
    return {c.stateDim, c.hiddenDim, c.hiddenDim, 1};
}

bool setError(QString* errorOut, const QString& reason)
{
    if (errorOut) {
        *errorOut = reason;
    }
    return false;
}

} // namespace

ActorCriticAgent::Config ActorCriticAgent::Config::fromSettings(const Settings& settings)
{
    Config config;
    config.stateDim = settings.stateDim;
    config.actionDim = settings.actionDim;
    config.hiddenDim = settings.hiddenDim;
    config.actorLearningRate = settings.actorLearningRate;
    config.criticLearningRate = settings.criticLearningRate;
    config.gamma = settings.gamma;
    config.nStep = settings.nStep;
    config.explorationNoise = settings.explorationNoise;
    config.seed = settings.seed;
    return config;
}

ActorCriticAgent::ActorCriticAgent(const Config& config)
    : m_config(config)
    , m_rng(config.seed)
    , m_actor(actorSizes(config),
              {Activation::Relu, Activation::Relu, Activation::Tanh},
              m_rng)
    , m_critic(criticSizes(config),
               {Activation::Relu, Activation::Relu, Activation::Linear},
               m_rng)
    , m_actorOptimizer(config.actorLearningRate)
    , m_criticOptimizer(config.criticLearningRate)
{
    m_config.nStep = std::max(m_config.nStep, 1);
    LOG_INFO(rtAgent, "Actor-critic ready: state=%d action=%d hidden=%d gamma=%.3f n=%d",
             m_config.stateDim, m_config.actionDim, m_config.hiddenDim,
             m_config.gamma, m_config.nStep);
}

Eigen::VectorXd ActorCriticAgent::toEigen(const QVector<double>& values)
{
    Eigen::VectorXd out(values.size());
    for (int i = 0; i < values.size(); ++i) {
        out(i) = values.at(i);
    }
    return out;
}

QVector<double> ActorCriticAgent::fromEigen(const Eigen::VectorXd& values)
{
    QVector<double> out(static_cast<int>(values.size()));
    for (int i = 0; i < out.size(); ++i) {
        out[i] = values(i);
    }
    return out;
}

bool ActorCriticAgent::checkState(const StateVector& state, QString* errorOut) const
{
    if (state.size() != m_config.stateDim) {
        LOG_WARN(rtAgent, "State dimension %d does not match %d",
                 int(state.size()), m_config.stateDim);
        return setError(errorOut, QStringLiteral("state_dimension_mismatch"));
    }
    return true;
}

std::optional<ActionSample> ActorCriticAgent::getAction(const StateVector& state,
                                                        bool stochastic,
                                                        QString* errorOut)
{
    if (!checkState(state, errorOut)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const Eigen::VectorXd raw = m_actor.forward(toEigen(state));

    ActionSample sample;
    sample.rawAction = fromEigen(raw);
    sample.action = sample.rawAction;
    if (stochastic) {
        std::normal_distribution<double> noise(0.0, m_config.explorationNoise);
        for (double& component : sample.action) {
            component += noise(m_rng);
        }
    }
    return sample;
}

std::optional<double> ActorCriticAgent::value(const StateVector& state, QString* errorOut) const
{
    if (!checkState(state, errorOut)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_critic.forward(toEigen(state))(0);
}

QVector<double> ActorCriticAgent::nStepTargets(const QVector<double>& rewards,
                                               const QVector<double>& values,
                                               double gamma,
                                               int n)
{
    const int length = rewards.size();
    const int horizon = std::max(n, 1);
    QVector<double> targets(length, 0.0);
    for (int i = 0; i < length; ++i) {
        double g = 0.0;
        double discount = 1.0;
        const int steps = std::min(horizon, length - i);
        for (int k = 0; k < steps; ++k) {
            g += discount * rewards.at(i + k);
            discount *= gamma;
        }
        if (i + horizon < length && i + horizon < values.size()) {
            g += std::pow(gamma, horizon) * values.at(i + horizon);
        }
        targets[i] = g;
    }
    return targets;
}

std::optional<TrainLosses> ActorCriticAgent::train(const QVector<StateVector>& states,
                                                   const QVector<ActionVector>& actions,
                                                   const QVector<double>& rewards,
                                                   QString* errorOut)
{
    TrainLosses losses;
    if (states.isEmpty() && actions.isEmpty() && rewards.isEmpty()) {
        return losses;
    }
    if (states.size() != actions.size() || states.size() != rewards.size()) {
        LOG_WARN(rtAgent, "Trajectory lengths differ: states=%d actions=%d rewards=%d",
                 int(states.size()), int(actions.size()), int(rewards.size()));
        setError(errorOut, QStringLiteral("trajectory_length_mismatch"));
        return std::nullopt;
    }
    for (const StateVector& state : states) {
        if (!checkState(state, errorOut)) {
            return std::nullopt;
        }
    }
    for (const ActionVector& action : actions) {
        if (action.size() != m_config.actionDim) {
            LOG_WARN(rtAgent, "Action dimension %d does not match %d",
                     int(action.size()), m_config.actionDim);
            setError(errorOut, QStringLiteral("action_dimension_mismatch"));
            return std::nullopt;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    const int length = states.size();
    const double invLength = 1.0 / static_cast<double>(length);
    const double invActionDim = 1.0 / static_cast<double>(m_config.actionDim);

    std::vector<Mlp::ForwardCache> criticCaches(static_cast<size_t>(length));
    QVector<double> values(length, 0.0);
    for (int i = 0; i < length; ++i) {
        values[i] = m_critic.forward(toEigen(states.at(i)), &criticCaches[static_cast<size_t>(i)])(0);
    }

    // Targets and advantages treat V as a constant.
    const QVector<double> targets = nStepTargets(rewards, values, m_config.gamma, m_config.nStep);

    MlpGradients criticGrads = m_critic.zeroGradients();
    MlpGradients actorGrads = m_actor.zeroGradients();
    std::normal_distribution<double> noise(0.0, m_config.explorationNoise);

    double policyLoss = 0.0;
    double baselineLoss = 0.0;
    for (int i = 0; i < length; ++i) {
        const double error = targets.at(i) - values.at(i);
        const double advantage = error;
        baselineLoss += error * error;

        Eigen::VectorXd valueGrad(1);
        valueGrad(0) = -2.0 * error * invLength;
        m_critic.accumulateGradients(criticCaches[static_cast<size_t>(i)], valueGrad, &criticGrads);

        // Re-sample the stochastic action and regress it toward the recorded one,
        // weighted by the advantage.
        Mlp::ForwardCache actorCache;
        const Eigen::VectorXd raw = m_actor.forward(toEigen(states.at(i)), &actorCache);
        Eigen::VectorXd sampled = raw;
        for (int k = 0; k < sampled.size(); ++k) {
            sampled(k) += noise(m_rng);
        }
        const Eigen::VectorXd diff = sampled - toEigen(actions.at(i));
        const double reconstruction = diff.squaredNorm() * invActionDim;
        policyLoss += -advantage * reconstruction;

        const Eigen::VectorXd actionGrad = (-advantage * invLength * 2.0 * invActionDim) * diff;
        m_actor.accumulateGradients(actorCache, actionGrad, &actorGrads);
    }

    losses.policyLoss = policyLoss * invLength;
    losses.baselineLoss = baselineLoss * invLength;
    losses.steps = length;

    m_actorOptimizer.step(m_actor, actorGrads);
    m_criticOptimizer.step(m_critic, criticGrads);
    ++m_trainingUpdates;

    LOG_DEBUG(rtAgent, "train steps=%d policy=%.6f baseline=%.6f",
              length, losses.policyLoss, losses.baselineLoss);
    return losses;
}

Episode ActorCriticAgent::runEpisode(ReadingEnvironment& env, int maxSteps, bool stochastic)
{
    Episode episode;
    episode.timestamp = QDateTime::currentDateTimeUtc();

    StateVector state = env.reset().state;
    const int limit = std::max(maxSteps, 1);
    for (int step = 0; step < limit; ++step) {
        QString error;
        const std::optional<ActionSample> sample = getAction(state, stochastic, &error);
        if (!sample) {
            LOG_WARN(rtAgent, "Episode aborted at step %d: %s", step, qUtf8Printable(error));
            break;
        }

        const StepResult result = env.step(sample->action);
        episode.states.append(state);
        episode.actions.append(sample->action);
        episode.rewards.append(result.reward);
        state = result.nextState;
        if (result.done || result.truncated) {
            break;
        }
    }
    return episode;
}

QVector<TrainLosses> ActorCriticAgent::trainOnEnvironment(ReadingEnvironment& env,
                                                          int maxSteps,
                                                          int episodes)
{
    QVector<TrainLosses> history;
    for (int e = 0; e < episodes; ++e) {
        const Episode episode = runEpisode(env, maxSteps, true);
        QString error;
        const std::optional<TrainLosses> losses =
            train(episode.states, episode.actions, episode.rewards, &error);
        if (!losses) {
            LOG_WARN(rtAgent, "Warm-up episode %d not trained: %s", e, qUtf8Printable(error));
            continue;
        }
        history.append(*losses);
        LOG_INFO(rtAgent, "Warm-up episode %d: length=%d reward=%.3f policy=%.4f baseline=%.4f",
                 e, episode.length(), episode.totalReward(),
                 losses->policyLoss, losses->baselineLoss);
    }
    return history;
}

bool ActorCriticAgent::save(const QString& path, QString* errorOut) const
{
    QJsonObject root;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        root[QStringLiteral("version")] = kWeightsFormatVersion;
        root[QStringLiteral("updatedAt")] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
        root[QStringLiteral("stateDim")] = m_config.stateDim;
        root[QStringLiteral("actionDim")] = m_config.actionDim;
        root[QStringLiteral("hiddenDim")] = m_config.hiddenDim;
        root[QStringLiteral("trainingUpdates")] = static_cast<double>(m_trainingUpdates);
        root[QStringLiteral("actor")] = m_actor.toJson();
        root[QStringLiteral("critic")] = m_critic.toJson();
    }

    QFile file(path);
    QDir().mkpath(QFileInfo(file).absolutePath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rtAgent, "Cannot write weights to %s: %s",
                  qUtf8Printable(path), qUtf8Printable(file.errorString()));
        return setError(errorOut, QStringLiteral("write_failed: %1").arg(file.errorString()));
    }
    const QByteArray payload = QJsonDocument(root).toJson(QJsonDocument::Compact);
    if (file.write(payload) != payload.size()) {
        LOG_ERROR(rtAgent, "Short write to %s", qUtf8Printable(path));
        return setError(errorOut, QStringLiteral("write_failed: %1").arg(file.errorString()));
    }
    file.close();
    LOG_INFO(rtAgent, "Saved weights to %s", qUtf8Printable(path));
    return true;
}

bool ActorCriticAgent::load(const QString& path, QString* errorOut)
{
    QFile file(path);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return setError(errorOut, QStringLiteral("not_found"));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return setError(errorOut, QStringLiteral("parse_error: %1").arg(parseError.errorString()));
    }

    const QJsonObject root = doc.object();
    if (root.value(QStringLiteral("stateDim")).toInt(-1) != m_config.stateDim
        || root.value(QStringLiteral("actionDim")).toInt(-1) != m_config.actionDim) {
        LOG_WARN(rtAgent, "Weights at %s have a different shape; ignoring", qUtf8Printable(path));
        return setError(errorOut, QStringLiteral("dimension_mismatch"));
    }

    QString layerError;
    std::optional<Mlp> actor = Mlp::fromJson(root.value(QStringLiteral("actor")).toObject(), &layerError);
    if (!actor) {
        return setError(errorOut, QStringLiteral("actor_%1").arg(layerError));
    }
    std::optional<Mlp> critic = Mlp::fromJson(root.value(QStringLiteral("critic")).toObject(), &layerError);
    if (!critic) {
        return setError(errorOut, QStringLiteral("critic_%1").arg(layerError));
    }
    if (actor->inputDim() != m_config.stateDim || actor->outputDim() != m_config.actionDim
        || critic->inputDim() != m_config.stateDim || critic->outputDim() != 1) {
        return setError(errorOut, QStringLiteral("dimension_mismatch"));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.hiddenDim = static_cast<int>(actor->layer(0).weights.rows());
    m_actor = std::move(*actor);
    m_critic = std::move(*critic);
    m_actorOptimizer.reset();
    m_criticOptimizer.reset();
    m_trainingUpdates = static_cast<long long>(root.value(QStringLiteral("trainingUpdates")).toDouble(0.0));
    LOG_INFO(rtAgent, "Loaded weights from %s", qUtf8Printable(path));
    return true;
}

long long ActorCriticAgent::trainingUpdates() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_trainingUpdates;
}

} // namespace rt
