#pragma once

#include <QDateTime>
#include <QJsonObject>

namespace rt {

struct TrainingStats {
    int episodesCollected = 0;
    long long totalTrainingSteps = 0;
    double averageReward = 0.0;
    QDateTime lastTrainingTime;  // invalid until the first pass
    double lastPolicyLoss = 0.0;
    double lastBaselineLoss = 0.0;

    QJsonObject toJson() const
    {
        QJsonObject json;
        json[QStringLiteral("episodes_collected")] = episodesCollected;
        json[QStringLiteral("total_training_steps")] = static_cast<double>(totalTrainingSteps);
        json[QStringLiteral("average_reward")] = averageReward;
        json[QStringLiteral("last_training_time")] = lastTrainingTime.isValid()
            ? QJsonValue(lastTrainingTime.toString(Qt::ISODateWithMs))
            : QJsonValue();
        json[QStringLiteral("last_policy_loss")] = lastPolicyLoss;
        json[QStringLiteral("last_baseline_loss")] = lastBaselineLoss;
        return json;
    }
};

} // namespace rt
