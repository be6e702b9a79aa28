#include "core/shared/settings.h"

#include <QDir>

namespace rt {

namespace {

bool reject(QString* errorOut, const QString& reason)
{
    if (errorOut) {
        *errorOut = reason;
    }
    return false;
}

} // namespace

bool Settings::validate(QString* errorOut) const
{
    if (errorOut) {
        errorOut->clear();
    }
    if (stateDim < kSemanticFeatureCount) {
        return reject(errorOut, QStringLiteral("stateDim must be >= %1").arg(kSemanticFeatureCount));
    }
    if (actionDim < 4) {
        return reject(errorOut, QStringLiteral("actionDim must be >= 4"));
    }
    if (hiddenDim < 1) {
        return reject(errorOut, QStringLiteral("hiddenDim must be >= 1"));
    }
    if (!(gamma > 0.0 && gamma <= 1.0)) {
        return reject(errorOut, QStringLiteral("gamma must be in (0, 1]"));
    }
    if (nStep < 1) {
        return reject(errorOut, QStringLiteral("nStep must be >= 1"));
    }
    if (actorLearningRate <= 0.0 || criticLearningRate <= 0.0) {
        return reject(errorOut, QStringLiteral("learning rates must be positive"));
    }
    if (explorationNoise < 0.0) {
        return reject(errorOut, QStringLiteral("explorationNoise must be >= 0"));
    }
    if (trainingIntervalSec < 1) {
        return reject(errorOut, QStringLiteral("trainingIntervalSec must be >= 1"));
    }
    if (maxEpisodeLength < 1 || maxRetainedEpisodes < 1 || minEpisodesForTraining < 1) {
        return reject(errorOut, QStringLiteral("episode caps must be >= 1"));
    }
    if (rewardWindow < 1) {
        return reject(errorOut, QStringLiteral("rewardWindow must be >= 1"));
    }
    return true;
}

QString Settings::resolvedDbPath() const
{
    if (!dbPath.isEmpty()) {
        return dbPath;
    }
    return QDir(dataDir).filePath(QStringLiteral("training.db"));
}

QString Settings::resolvedModelPath() const
{
    if (!modelPath.isEmpty()) {
        return modelPath;
    }
    return QDir(dataDir).filePath(QStringLiteral("models/actor_critic.json"));
}

} // namespace rt
