#pragma once

#include "core/shared/types.h"

#include <QString>
#include <cstdint>

namespace rt {

struct Settings {
    // Storage
    QString dataDir;
    QString dbPath;                          // defaults to <dataDir>/training.db
    QString modelPath;                       // defaults to <dataDir>/models/actor_critic.json

    // Agent
    int stateDim = kDefaultStateDim;
    int actionDim = kDefaultActionDim;
    int hiddenDim = 256;
    double actorLearningRate = 1e-3;
    double criticLearningRate = 1e-3;
    double gamma = 0.99;
    int nStep = 1;
    double explorationNoise = 0.1;
    uint32_t seed = 1337;

    // Training scheduler
    int trainingIntervalSec = 300;           // 5 minutes
    int maxEpisodeLength = 50;
    int maxRetainedEpisodes = 10;
    int minEpisodesForTraining = 2;
    int rewardWindow = 100;
    int persistedEpisodeSample = 5;

    bool validate(QString* errorOut = nullptr) const;
    QString resolvedDbPath() const;
    QString resolvedModelPath() const;
};

} // namespace rt
