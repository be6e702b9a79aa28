#include "core/state/state_builder.h"

#include "core/shared/logging.h"
#include "core/state/text_analyzer.h"

#include <algorithm>

namespace rt {

QVector<double> StateFeatures::toVector() const
{
    return {
        textDifficulty,
        textLength,
        textType,
        controls.readingSpeed,
        controls.pauseFrequency,
        controls.highlightIntensity,
        controls.chunkSize,
        userEngagement,
        userComprehension,
        sessionProgress,
        actionCount,
        recentCommands,
    };
}

QJsonObject StateFeatures::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("text_difficulty")] = textDifficulty;
    json[QStringLiteral("text_length")] = textLength;
    json[QStringLiteral("text_type")] = textType;
    json[QStringLiteral("reading_speed")] = controls.readingSpeed;
    json[QStringLiteral("pause_frequency")] = controls.pauseFrequency;
    json[QStringLiteral("highlight_intensity")] = controls.highlightIntensity;
    json[QStringLiteral("chunk_size")] = controls.chunkSize;
    json[QStringLiteral("user_engagement")] = userEngagement;
    json[QStringLiteral("user_comprehension")] = userComprehension;
    json[QStringLiteral("session_progress")] = sessionProgress;
    json[QStringLiteral("action_count")] = actionCount;
    json[QStringLiteral("recent_commands")] = recentCommands;
    return json;
}

StateBuilder::StateBuilder(int stateDim)
    : m_stateDim(std::max(stateDim, 1))
{
}

StateVector StateBuilder::build(const StateFeatures& features) const
{
    return padToDimension(features.toVector(), m_stateDim);
}

StateVector StateBuilder::fromRecord(const QueryRecord& record) const
{
    return build(featuresFromRecord(record));
}

StateVector StateBuilder::fromText(const QString& text,
                                   const QStringList& commands,
                                   const ControlSettings& controls,
                                   double progress,
                                   int actionCount) const
{
    return build(featuresFromText(text, commands, controls, progress, actionCount));
}

StateFeatures StateBuilder::featuresFromRecord(const QueryRecord& record)
{
    StateFeatures features;
    features.textDifficulty = record.textDifficulty;
    features.textLength = record.textLength;
    features.textType = record.textType;
    features.controls = record.currentSettings();
    features.userEngagement = record.userEngagement;
    features.userComprehension = record.userComprehension;
    features.sessionProgress = record.textProgress;
    features.actionCount = static_cast<double>(record.actionCount);
    features.recentCommands = TextAnalyzer::encodeRecentCommands(record.recentCommands);
    return features;
}

StateFeatures StateBuilder::featuresFromText(const QString& text,
                                             const QStringList& commands,
                                             const ControlSettings& controls,
                                             double progress,
                                             int actionCount)
{
    StateFeatures features;
    features.textDifficulty = TextAnalyzer::difficulty(text);
    features.textLength = TextAnalyzer::normalizedLength(text);
    features.textType = TextAnalyzer::textType(text);
    features.controls = controls;
    features.userEngagement = TextAnalyzer::engagementFromCommands(commands);
    features.userComprehension = TextAnalyzer::comprehensionFromCommands(commands);
    features.sessionProgress = kUnitRange.clamp(progress);
    features.actionCount = static_cast<double>(std::max(actionCount, 0));
    features.recentCommands = TextAnalyzer::encodeRecentCommands(commands);
    return features;
}

StateVector StateBuilder::padToDimension(const QVector<double>& features, int dim)
{
    const int target = std::max(dim, 0);
    if (features.size() > target) {
        LOG_WARN(rtState, "State features truncated from %d to %d", int(features.size()), target);
        return features.mid(0, target);
    }

    StateVector state = features;
    state.resize(target);
    for (int i = features.size(); i < target; ++i) {
        state[i] = 0.0;
    }
    return state;
}

} // namespace rt
