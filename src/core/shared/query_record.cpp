#include "core/shared/query_record.h"

#include <QJsonArray>

#include <cmath>

namespace rt {

namespace {

struct RangeCheck {
    const char* field;
    double value;
    ValueRange range;
};

bool failWith(ValidationError* errorOut, const QString& field, double value,
              ValueRange range, bool unbounded = false)
{
    if (errorOut) {
        errorOut->field = field;
        errorOut->value = value;
        errorOut->range = range;
        errorOut->unbounded = unbounded;
    }
    return false;
}

} // namespace

QString ValidationError::message() const
{
    if (unbounded) {
        return QStringLiteral("%1 must be >= %2 (got %3)")
            .arg(field)
            .arg(range.min)
            .arg(value);
    }
    return QStringLiteral("%1 must be in [%2, %3] (got %4)")
        .arg(field)
        .arg(range.min)
        .arg(range.max)
        .arg(value);
}

bool QueryRecord::validate(ValidationError* errorOut) const
{
    const RangeCheck required[] = {
        {"text_difficulty", textDifficulty, kUnitRange},
        {"text_type", textType, kUnitRange},
        {"text_length", textLength, kUnitRange},
        {"user_engagement", userEngagement, kUnitRange},
        {"user_comprehension", userComprehension, kUnitRange},
        {"text_progress", textProgress, kUnitRange},
        {"current_reading_speed", currentReadingSpeed, kReadingSpeedRange},
        {"current_pause_frequency", currentPauseFrequency, kPauseFrequencyRange},
        {"current_highlight_intensity", currentHighlightIntensity, kHighlightIntensityRange},
        {"current_chunk_size", currentChunkSize, kChunkSizeRange},
    };
    for (const RangeCheck& check : required) {
        if (!check.range.contains(check.value)) {
            return failWith(errorOut, QString::fromLatin1(check.field), check.value, check.range);
        }
    }

    if (!(sessionDuration >= 0.0) || !std::isfinite(sessionDuration)) {
        return failWith(errorOut, QStringLiteral("session_duration"), sessionDuration,
                        ValueRange{0.0, 0.0}, true);
    }
    if (actionCount < 0) {
        return failWith(errorOut, QStringLiteral("action_count"), actionCount,
                        ValueRange{0.0, 0.0}, true);
    }

    if (preferredSpeed && !kReadingSpeedRange.contains(*preferredSpeed)) {
        return failWith(errorOut, QStringLiteral("preferred_speed"), *preferredSpeed, kReadingSpeedRange);
    }
    if (preferredPauses && !kPauseFrequencyRange.contains(*preferredPauses)) {
        return failWith(errorOut, QStringLiteral("preferred_pauses"), *preferredPauses, kPauseFrequencyRange);
    }
    if (preferredHighlighting && !kHighlightIntensityRange.contains(*preferredHighlighting)) {
        return failWith(errorOut, QStringLiteral("preferred_highlighting"), *preferredHighlighting,
                        kHighlightIntensityRange);
    }
    return true;
}

bool QueryRecord::hasPreferences() const
{
    return preferredSpeed.has_value()
        || preferredPauses.has_value()
        || preferredHighlighting.has_value();
}

ControlSettings QueryRecord::currentSettings() const
{
    ControlSettings settings;
    settings.readingSpeed = currentReadingSpeed;
    settings.pauseFrequency = currentPauseFrequency;
    settings.highlightIntensity = currentHighlightIntensity;
    settings.chunkSize = currentChunkSize;
    return settings;
}

QJsonObject QueryRecord::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("text_difficulty")] = textDifficulty;
    json[QStringLiteral("text_type")] = textType;
    json[QStringLiteral("text_length")] = textLength;
    json[QStringLiteral("user_engagement")] = userEngagement;
    json[QStringLiteral("user_comprehension")] = userComprehension;
    json[QStringLiteral("recent_commands")] = QJsonArray::fromStringList(recentCommands);
    json[QStringLiteral("text_progress")] = textProgress;
    json[QStringLiteral("current_reading_speed")] = currentReadingSpeed;
    json[QStringLiteral("current_pause_frequency")] = currentPauseFrequency;
    json[QStringLiteral("current_highlight_intensity")] = currentHighlightIntensity;
    json[QStringLiteral("current_chunk_size")] = currentChunkSize;
    json[QStringLiteral("session_duration")] = sessionDuration;
    json[QStringLiteral("action_count")] = actionCount;
    if (preferredSpeed) {
        json[QStringLiteral("preferred_speed")] = *preferredSpeed;
    }
    if (preferredPauses) {
        json[QStringLiteral("preferred_pauses")] = *preferredPauses;
    }
    if (preferredHighlighting) {
        json[QStringLiteral("preferred_highlighting")] = *preferredHighlighting;
    }
    return json;
}

} // namespace rt
