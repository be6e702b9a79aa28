#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QVector>

#include <numeric>

namespace rt {

// One bounded trajectory; the unit the scheduler trains on.
struct Episode {
    QVector<StateVector> states;
    QVector<ActionVector> actions;
    QVector<double> rewards;
    QDateTime timestamp;

    int length() const { return rewards.size(); }
    bool isEmpty() const { return rewards.isEmpty(); }
    double totalReward() const
    {
        return std::accumulate(rewards.cbegin(), rewards.cend(), 0.0);
    }
};

} // namespace rt
