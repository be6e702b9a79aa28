#include "core/shared/types.h"

namespace rt {

QString controlSettingToString(ControlSetting setting)
{
    switch (setting) {
    case ControlSetting::ReadingSpeed:       return QStringLiteral("reading_speed");
    case ControlSetting::PauseFrequency:     return QStringLiteral("pause_frequency");
    case ControlSetting::HighlightIntensity: return QStringLiteral("highlight_intensity");
    case ControlSetting::ChunkSize:          return QStringLiteral("chunk_size");
    }
    return QStringLiteral("reading_speed");
}

std::optional<ControlSetting> controlSettingFromString(const QString& str)
{
    if (str == QLatin1String("reading_speed"))       return ControlSetting::ReadingSpeed;
    if (str == QLatin1String("pause_frequency"))     return ControlSetting::PauseFrequency;
    if (str == QLatin1String("highlight_intensity")) return ControlSetting::HighlightIntensity;
    if (str == QLatin1String("chunk_size"))          return ControlSetting::ChunkSize;
    return std::nullopt;
}

ValueRange controlSettingRange(ControlSetting setting)
{
    switch (setting) {
    case ControlSetting::ReadingSpeed:       return kReadingSpeedRange;
    case ControlSetting::PauseFrequency:     return kPauseFrequencyRange;
    case ControlSetting::HighlightIntensity: return kHighlightIntensityRange;
    case ControlSetting::ChunkSize:          return kChunkSizeRange;
    }
    return kUnitRange;
}

double ControlSettings::value(ControlSetting setting) const
{
    switch (setting) {
    case ControlSetting::ReadingSpeed:       return readingSpeed;
    case ControlSetting::PauseFrequency:     return pauseFrequency;
    case ControlSetting::HighlightIntensity: return highlightIntensity;
    case ControlSetting::ChunkSize:          return chunkSize;
    }
    return 0.0;
}

void ControlSettings::setValue(ControlSetting setting, double value)
{
    switch (setting) {
    case ControlSetting::ReadingSpeed:       readingSpeed = value; break;
    case ControlSetting::PauseFrequency:     pauseFrequency = value; break;
    case ControlSetting::HighlightIntensity: highlightIntensity = value; break;
    case ControlSetting::ChunkSize:          chunkSize = value; break;
    }
}

QJsonObject ControlSettings::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("reading_speed")] = readingSpeed;
    json[QStringLiteral("pause_frequency")] = pauseFrequency;
    json[QStringLiteral("highlight_intensity")] = highlightIntensity;
    json[QStringLiteral("chunk_size")] = chunkSize;
    return json;
}

ControlSettings ControlSettings::fromJson(const QJsonObject& json)
{
    ControlSettings settings;
    settings.readingSpeed = json.value(QStringLiteral("reading_speed")).toDouble(settings.readingSpeed);
    settings.pauseFrequency = json.value(QStringLiteral("pause_frequency")).toDouble(settings.pauseFrequency);
    settings.highlightIntensity = json.value(QStringLiteral("highlight_intensity"))
                                      .toDouble(settings.highlightIntensity);
    settings.chunkSize = json.value(QStringLiteral("chunk_size")).toDouble(settings.chunkSize);
    return settings;
}

double readingSpeedFromAction(double component)
{
    return kReadingSpeedRange.clamp(1.0 + component * 0.5);
}

double pauseFrequencyFromAction(double component)
{
    return kPauseFrequencyRange.clamp(0.3 + component * 0.5);
}

double highlightIntensityFromAction(double component)
{
    return kHighlightIntensityRange.clamp(0.5 + component * 0.5);
}

double chunkSizeFromAction(double component)
{
    return kChunkSizeRange.clamp(0.5 + component * 0.5);
}

ControlSettings controlSettingsFromAction(const ActionVector& action)
{
    auto component = [&action](int index) {
        return index < action.size() ? action.at(index) : 0.0;
    };

    ControlSettings settings;
    settings.readingSpeed = readingSpeedFromAction(component(0));
    settings.pauseFrequency = pauseFrequencyFromAction(component(1));
    settings.highlightIntensity = highlightIntensityFromAction(component(2));
    settings.chunkSize = chunkSizeFromAction(component(3));
    return settings;
}

} // namespace rt
