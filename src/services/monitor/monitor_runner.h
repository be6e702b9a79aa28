#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

namespace rt {

struct MonitorScenario {
    QString name;
    QString text;
    QStringList commands;
};

// Replays fixed listener scenarios through the query facade, feeds the
// results to a training scheduler and reports its status.
class MonitorRunner {
public:
    struct Options {
        int episodes = 3;
        bool train = true;
    };

    MonitorRunner(Settings settings, Options options);

    static QVector<MonitorScenario> defaultScenarios();

    // Returns a process exit code.
    int run();

    QJsonObject report() const { return m_report; }

private:
    Settings m_settings;
    Options m_options;
    QJsonObject m_report;
};

} // namespace rt
