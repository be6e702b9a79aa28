#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include <optional>

namespace rt {

enum class ChangeSource {
    Agent,
    Feedback,
    UserOverride,
};

QString changeSourceToString(ChangeSource source);
std::optional<ChangeSource> changeSourceFromString(const QString& str);
double defaultConfidence(ChangeSource source);

struct SettingChange {
    ControlSetting setting = ControlSetting::ReadingSpeed;
    double oldValue = 0.0;
    double newValue = 0.0;
    QDateTime timestamp;
    ChangeSource source = ChangeSource::Agent;
    double confidence = 1.0;

    QJsonObject toJson() const;
};

struct SettingTrend {
    QString trend = QStringLiteral("stable");  // increasing | decreasing | stable
    int changes = 0;
    double averageValue = 0.0;
    double currentValue = 0.0;
    QVector<SettingChange> recentChanges;      // last 5 in the window

    QJsonObject toJson() const;
};

// Current delivery settings plus a bounded log of how they got there. The
// oldest changes are evicted once the log holds maxHistory entries.
class SettingsHistory {
public:
    static constexpr int kTrendRecentChanges = 5;
    static constexpr int kMaxHistory = 1000;

    explicit SettingsHistory(int maxHistory = kMaxHistory);

    int maxHistory() const { return m_maxHistory; }

    ControlSettings currentSettings() const { return m_current; }

    void applyChange(ControlSetting setting, double newValue, ChangeSource source,
                     std::optional<double> confidence = std::nullopt);
    void applySettings(const ControlSettings& settings, ChangeSource source);

    QVector<SettingChange> history(std::optional<ControlSetting> setting = std::nullopt) const;
    QVector<SettingChange> recentChanges(int minutes = 10) const;
    SettingTrend trend(ControlSetting setting, int windowMinutes = 30) const;

    QString exportJson() const;
    bool importJson(const QString& json, QString* errorOut = nullptr);

private:
    void trimHistory();

    ControlSettings m_current;
    QVector<SettingChange> m_history;
    int m_maxHistory;
};

} // namespace rt
