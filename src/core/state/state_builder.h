#pragma once

#include "core/shared/query_record.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QStringList>

namespace rt {

// Semantic slots of the state vector, in vector order.
struct StateFeatures {
    double textDifficulty = 0.5;
    double textLength = 0.5;
    double textType = 0.4;
    ControlSettings controls;
    double userEngagement = 0.5;
    double userComprehension = 0.5;
    double sessionProgress = 0.0;
    double actionCount = 0.0;
    double recentCommands = 0.0;  // min(1, count / 10)

    QVector<double> toVector() const;
    QJsonObject toJson() const;
};

class StateBuilder {
public:
    explicit StateBuilder(int stateDim = kDefaultStateDim);

    int stateDim() const { return m_stateDim; }

    StateVector build(const StateFeatures& features) const;
    StateVector fromRecord(const QueryRecord& record) const;
    StateVector fromText(const QString& text,
                         const QStringList& commands,
                         const ControlSettings& controls,
                         double progress,
                         int actionCount) const;

    static StateFeatures featuresFromRecord(const QueryRecord& record);
    static StateFeatures featuresFromText(const QString& text,
                                          const QStringList& commands,
                                          const ControlSettings& controls,
                                          double progress,
                                          int actionCount);

    // Zero-fills up to dim; longer input is truncated to dim.
    static StateVector padToDimension(const QVector<double>& features, int dim);

private:
    int m_stateDim;
};

} // namespace rt
