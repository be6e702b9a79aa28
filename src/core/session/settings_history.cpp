#include "core/session/settings_history.h"

#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>
#include <numeric>

namespace rt {

namespace {

constexpr ControlSetting kAllSettings[] = {
    ControlSetting::ReadingSpeed,
    ControlSetting::PauseFrequency,
    ControlSetting::HighlightIntensity,
    ControlSetting::ChunkSize,
};

double toEpochSeconds(const QDateTime& dt)
{
    return static_cast<double>(dt.toMSecsSinceEpoch()) / 1000.0;
}

QDateTime fromEpochSeconds(double seconds)
{
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(seconds * 1000.0), Qt::UTC);
}

} // namespace

QString changeSourceToString(ChangeSource source)
{
    switch (source) {
    case ChangeSource::Agent:        return QStringLiteral("agent");
    case ChangeSource::Feedback:     return QStringLiteral("feedback");
    case ChangeSource::UserOverride: return QStringLiteral("user_override");
    }
    return QStringLiteral("agent");
}

std::optional<ChangeSource> changeSourceFromString(const QString& str)
{
    if (str == QLatin1String("agent"))         return ChangeSource::Agent;
    if (str == QLatin1String("feedback"))      return ChangeSource::Feedback;
    if (str == QLatin1String("user_override")) return ChangeSource::UserOverride;
    return std::nullopt;
}

double defaultConfidence(ChangeSource source)
{
    switch (source) {
    case ChangeSource::Agent:        return 0.9;
    case ChangeSource::Feedback:     return 0.8;
    case ChangeSource::UserOverride: return 1.0;
    }
    return 1.0;
}

QJsonObject SettingChange::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("setting")] = controlSettingToString(setting);
    json[QStringLiteral("old_value")] = oldValue;
    json[QStringLiteral("new_value")] = newValue;
    json[QStringLiteral("timestamp")] = toEpochSeconds(timestamp);
    json[QStringLiteral("source")] = changeSourceToString(source);
    json[QStringLiteral("confidence")] = confidence;
    return json;
}

QJsonObject SettingTrend::toJson() const
{
    QJsonArray recent;
    for (const SettingChange& change : recentChanges) {
        recent.append(change.toJson());
    }

    QJsonObject json;
    json[QStringLiteral("trend")] = trend;
    json[QStringLiteral("changes")] = changes;
    json[QStringLiteral("average_value")] = averageValue;
    json[QStringLiteral("current_value")] = currentValue;
    json[QStringLiteral("recent_changes")] = recent;
    return json;
}

SettingsHistory::SettingsHistory(int maxHistory)
    : m_maxHistory(std::max(maxHistory, 1))
{
}

void SettingsHistory::applyChange(ControlSetting setting, double newValue, ChangeSource source,
                                  std::optional<double> confidence)
{
    SettingChange change;
    change.setting = setting;
    change.oldValue = m_current.value(setting);
    change.newValue = newValue;
    change.timestamp = QDateTime::currentDateTimeUtc();
    change.source = source;
    change.confidence = confidence.value_or(defaultConfidence(source));

    m_current.setValue(setting, newValue);
    m_history.append(change);
    trimHistory();
}

void SettingsHistory::trimHistory()
{
    const int excess = int(m_history.size()) - m_maxHistory;
    if (excess > 0) {
        m_history.remove(0, excess);
    }
}

void SettingsHistory::applySettings(const ControlSettings& settings, ChangeSource source)
{
    for (ControlSetting setting : kAllSettings) {
        applyChange(setting, settings.value(setting), source);
    }
}

QVector<SettingChange> SettingsHistory::history(std::optional<ControlSetting> setting) const
{
    if (!setting) {
        return m_history;
    }
    QVector<SettingChange> out;
    for (const SettingChange& change : m_history) {
        if (change.setting == *setting) {
            out.append(change);
        }
    }
    return out;
}

QVector<SettingChange> SettingsHistory::recentChanges(int minutes) const
{
    const QDateTime cutoff = QDateTime::currentDateTimeUtc().addSecs(-60LL * minutes);
    QVector<SettingChange> out;
    for (const SettingChange& change : m_history) {
        if (change.timestamp > cutoff) {
            out.append(change);
        }
    }
    return out;
}

SettingTrend SettingsHistory::trend(ControlSetting setting, int windowMinutes) const
{
    const QDateTime cutoff = QDateTime::currentDateTimeUtc().addSecs(-60LL * windowMinutes);
    QVector<double> values;
    QVector<SettingChange> inWindow;
    for (const SettingChange& change : m_history) {
        if (change.setting == setting && change.timestamp > cutoff) {
            values.append(change.newValue);
            inWindow.append(change);
        }
    }

    SettingTrend out;
    out.currentValue = m_current.value(setting);
    out.changes = values.size();
    if (values.isEmpty()) {
        out.averageValue = out.currentValue;
        return out;
    }

    out.averageValue = std::accumulate(values.cbegin(), values.cend(), 0.0) / values.size();
    if (values.size() >= 2) {
        if (values.last() > values.first()) {
            out.trend = QStringLiteral("increasing");
        } else if (values.last() < values.first()) {
            out.trend = QStringLiteral("decreasing");
        }
    }
    out.recentChanges = inWindow.mid(std::max(0, int(inWindow.size()) - kTrendRecentChanges));
    return out;
}

QString SettingsHistory::exportJson() const
{
    QJsonArray changes;
    for (const SettingChange& change : m_history) {
        changes.append(change.toJson());
    }

    QJsonObject root;
    root[QStringLiteral("current_settings")] = m_current.toJson();
    root[QStringLiteral("setting_history")] = changes;
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

bool SettingsHistory::importJson(const QString& json, QString* errorOut)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorOut) {
            *errorOut = QStringLiteral("parse_error: %1").arg(parseError.errorString());
        }
        return false;
    }

    const QJsonObject root = doc.object();
    QVector<SettingChange> imported;
    const QJsonArray changes = root.value(QStringLiteral("setting_history")).toArray();
    for (const QJsonValue& value : changes) {
        const QJsonObject obj = value.toObject();
        const std::optional<ControlSetting> setting =
            controlSettingFromString(obj.value(QStringLiteral("setting")).toString());
        const std::optional<ChangeSource> source =
            changeSourceFromString(obj.value(QStringLiteral("source")).toString());
        if (!setting || !source) {
            if (errorOut) {
                *errorOut = QStringLiteral("invalid_change_entry");
            }
            return false;
        }

        SettingChange change;
        change.setting = *setting;
        change.source = *source;
        change.oldValue = obj.value(QStringLiteral("old_value")).toDouble();
        change.newValue = obj.value(QStringLiteral("new_value")).toDouble();
        change.timestamp = fromEpochSeconds(obj.value(QStringLiteral("timestamp")).toDouble());
        change.confidence = obj.value(QStringLiteral("confidence")).toDouble(defaultConfidence(*source));
        imported.append(change);
    }

    m_current = ControlSettings::fromJson(root.value(QStringLiteral("current_settings")).toObject());
    m_history = imported;
    trimHistory();
    LOG_DEBUG(rtCore, "Imported %d setting changes", int(m_history.size()));
    return true;
}

} // namespace rt
