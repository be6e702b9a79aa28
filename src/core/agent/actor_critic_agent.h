#pragma once

#include "core/agent/adam_optimizer.h"
#include "core/agent/mlp.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/training/episode.h"

#include <QString>
#include <QVector>

#include <mutex>
#include <optional>
#include <random>

namespace rt {

class ReadingEnvironment;

struct ActionSample {
    ActionVector action;     // noisy when sampled stochastically, raw otherwise
    ActionVector rawAction;  // actor output in [-1, 1]
};

struct TrainLosses {
    double policyLoss = 0.0;
    double baselineLoss = 0.0;
    int steps = 0;
};

// Actor (state -> tanh-bounded action) and critic (state -> value), each with
// its own Adam optimizer. Safe to call from the scheduler thread and the query
// path concurrently.
class ActorCriticAgent {
public:
    struct Config {
        int stateDim = kDefaultStateDim;
        int actionDim = kDefaultActionDim;
        int hiddenDim = 256;
        double actorLearningRate = 1e-3;
        double criticLearningRate = 1e-3;
        double gamma = 0.99;
        int nStep = 1;
        double explorationNoise = 0.1;
        uint32_t seed = 1337;

        static Config fromSettings(const Settings& settings);
    };

    explicit ActorCriticAgent(const Config& config = Config());

    const Config& config() const { return m_config; }
    int stateDim() const { return m_config.stateDim; }
    int actionDim() const { return m_config.actionDim; }

    std::optional<ActionSample> getAction(const StateVector& state,
                                          bool stochastic,
                                          QString* errorOut = nullptr);
    std::optional<double> value(const StateVector& state, QString* errorOut = nullptr) const;

    // Empty input is a no-op that returns zero losses.
    std::optional<TrainLosses> train(const QVector<StateVector>& states,
                                     const QVector<ActionVector>& actions,
                                     const QVector<double>& rewards,
                                     QString* errorOut = nullptr);

    // G[i] = sum_{k<n} gamma^k r[i+k] + gamma^n V[i+n]; V past the end counts as 0.
    static QVector<double> nStepTargets(const QVector<double>& rewards,
                                        const QVector<double>& values,
                                        double gamma,
                                        int n);

    Episode runEpisode(ReadingEnvironment& env, int maxSteps, bool stochastic = true);
    QVector<TrainLosses> trainOnEnvironment(ReadingEnvironment& env, int maxSteps, int episodes);

    bool save(const QString& path, QString* errorOut = nullptr) const;
    bool load(const QString& path, QString* errorOut = nullptr);

    long long trainingUpdates() const;

private:
    static Eigen::VectorXd toEigen(const QVector<double>& values);
    static QVector<double> fromEigen(const Eigen::VectorXd& values);
    bool checkState(const StateVector& state, QString* errorOut) const;

    Config m_config;
    mutable std::mutex m_mutex;
    std::mt19937 m_rng;
    Mlp m_actor;
    Mlp m_critic;
    AdamOptimizer m_actorOptimizer;
    AdamOptimizer m_criticOptimizer;
    long long m_trainingUpdates = 0;
};

} // namespace rt
