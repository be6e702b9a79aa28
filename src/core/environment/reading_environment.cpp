#include "core/environment/reading_environment.h"

#include "core/shared/logging.h"

#include <algorithm>

namespace rt {

QJsonObject SessionRecord::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("session_id")] = sessionId;
    json[QStringLiteral("start_time")] = startTime.toString(Qt::ISODateWithMs);
    if (endTime.isValid()) {
        json[QStringLiteral("end_time")] = endTime.toString(Qt::ISODateWithMs);
    }
    json[QStringLiteral("initial_settings")] = initialSettings.toJson();
    json[QStringLiteral("final_settings")] = finalSettings.toJson();
    json[QStringLiteral("duration")] = durationSeconds;
    json[QStringLiteral("steps")] = steps;
    return json;
}

ReadingEnvironment::ReadingEnvironment(int stateDim, int maxSessionSteps)
    : m_stateBuilder(stateDim)
    , m_maxSessionSteps(std::max(maxSessionSteps, 1))
{
}

ResetResult ReadingEnvironment::reset()
{
    m_controls = ControlSettings();
    m_stepCount = 0;
    m_actionCount = 0;
    m_textProgress = 0.0;

    ResetResult result;
    result.state = currentState();
    result.info[QStringLiteral("settings")] = m_controls.toJson();
    result.info[QStringLiteral("session_count")] = sessionCount();
    return result;
}

StepResult ReadingEnvironment::step(const ActionVector& action)
{
    // Components beyond chunk size are reserved and ignored.
    if (action.size() > 0) {
        m_controls.readingSpeed = readingSpeedFromAction(action.at(0));
    }
    if (action.size() > 1) {
        m_controls.pauseFrequency = pauseFrequencyFromAction(action.at(1));
    }
    if (action.size() > 2) {
        m_controls.highlightIntensity = highlightIntensityFromAction(action.at(2));
    }
    if (action.size() > 3) {
        m_controls.chunkSize = chunkSizeFromAction(action.at(3));
    }

    ++m_stepCount;
    ++m_actionCount;

    StepResult result;
    result.breakdown = rewardBreakdown();
    result.reward = result.breakdown.totalReward;
    result.done = isSessionComplete();
    result.truncated = false;
    result.nextState = currentState();
    result.info = stepInfo(result.breakdown);

    LOG_DEBUG(rtEnv, "step %d reward=%.3f done=%d", m_stepCount, result.reward, result.done);
    return result;
}

void ReadingEnvironment::recordInteraction()
{
    ++m_stepCount;
}

void ReadingEnvironment::applySettings(const ControlSettings& settings)
{
    m_controls.readingSpeed = kReadingSpeedRange.clamp(settings.readingSpeed);
    m_controls.pauseFrequency = kPauseFrequencyRange.clamp(settings.pauseFrequency);
    m_controls.highlightIntensity = kHighlightIntensityRange.clamp(settings.highlightIntensity);
    m_controls.chunkSize = kChunkSizeRange.clamp(settings.chunkSize);
}

void ReadingEnvironment::setTextFeatures(double difficulty, double type, double length)
{
    m_textDifficulty = kUnitRange.clamp(difficulty);
    m_textType = kUnitRange.clamp(type);
    m_textLength = kUnitRange.clamp(length);
}

void ReadingEnvironment::setTextContent(const QString& text)
{
    m_textContent = text;
    setTextFeatures(TextAnalyzer::difficulty(text),
                    TextAnalyzer::textType(text),
                    TextAnalyzer::normalizedLength(text));
    LOG_DEBUG(rtEnv, "text content set: difficulty=%.3f type=%.2f length=%.3f",
              m_textDifficulty, m_textType, m_textLength);
}

void ReadingEnvironment::updateTextProgress(double progress)
{
    m_textProgress = kUnitRange.clamp(progress);
}

void ReadingEnvironment::setUserSignals(double engagement, double comprehension)
{
    m_userEngagement = kUnitRange.clamp(engagement);
    m_userComprehension = kUnitRange.clamp(comprehension);
}

void ReadingEnvironment::addCommand(const QString& command)
{
    m_recentCommands.append(command);
    while (m_recentCommands.size() > kMaxRecentCommands) {
        m_recentCommands.removeFirst();
    }
}

void ReadingEnvironment::setRecentCommands(const QStringList& commands)
{
    m_recentCommands = commands.mid(std::max(0, int(commands.size()) - kMaxRecentCommands));
}

void ReadingEnvironment::setActionCount(int actionCount)
{
    m_actionCount = std::max(actionCount, 0);
}

void ReadingEnvironment::setSessionDuration(double seconds)
{
    m_sessionDuration = std::max(seconds, 0.0);
}

void ReadingEnvironment::updateUserFeedback(const UserFeedback& feedback)
{
    UserFeedback entry = feedback;
    if (!entry.timestamp.isValid()) {
        entry.timestamp = QDateTime::currentDateTimeUtc();
    }
    m_feedbackHistory.append(entry);
    if (m_feedbackHistory.size() > kMaxFeedbackHistory) {
        m_feedbackHistory.removeFirst();
    }

    if (entry.comprehension) {
        m_userComprehension = kUnitRange.clamp(*entry.comprehension);
    }
    if (entry.engagement) {
        m_userEngagement = kUnitRange.clamp(*entry.engagement);
    }
}

int ReadingEnvironment::startSession()
{
    if (!m_sessions.isEmpty() && m_sessions.last().isOpen()) {
        LOG_WARN(rtEnv, "Session %d still open; closing before starting a new one",
                 m_sessions.last().sessionId);
        endSession();
    }

    SessionRecord record;
    record.sessionId = m_sessions.size() + 1;
    record.startTime = QDateTime::currentDateTimeUtc();
    record.initialSettings = m_controls;
    m_sessions.append(record);
    LOG_INFO(rtEnv, "Session %d started", record.sessionId);
    return record.sessionId;
}

bool ReadingEnvironment::endSession(SessionRecord* recordOut)
{
    if (m_sessions.isEmpty() || !m_sessions.last().isOpen()) {
        return false;
    }

    SessionRecord& record = m_sessions.last();
    record.endTime = QDateTime::currentDateTimeUtc();
    record.finalSettings = m_controls;
    record.durationSeconds = record.startTime.msecsTo(record.endTime) / 1000.0;
    record.steps = m_stepCount;
    LOG_INFO(rtEnv, "Session %d ended after %.1fs (%d steps)",
             record.sessionId, record.durationSeconds, record.steps);
    if (recordOut) {
        *recordOut = record;
    }
    return true;
}

StateFeatures ReadingEnvironment::currentFeatures() const
{
    StateFeatures features;
    features.textDifficulty = m_textDifficulty;
    features.textLength = m_textLength;
    features.textType = m_textType;
    features.controls = m_controls;
    features.userEngagement = m_userEngagement;
    features.userComprehension = m_userComprehension;
    features.sessionProgress = m_textProgress;
    features.actionCount = static_cast<double>(m_actionCount);
    features.recentCommands = TextAnalyzer::encodeRecentCommands(m_recentCommands);
    return features;
}

StateVector ReadingEnvironment::currentState() const
{
    return m_stateBuilder.build(currentFeatures());
}

RewardBreakdown ReadingEnvironment::rewardBreakdown() const
{
    return RewardModel::breakdown(rewardInputs());
}

RewardInputs ReadingEnvironment::rewardInputs() const
{
    RewardInputs inputs;
    inputs.controls = m_controls;
    inputs.textDifficulty = m_textDifficulty;
    inputs.userEngagement = m_userEngagement;
    inputs.userComprehension = m_userComprehension;
    inputs.textProgress = m_textProgress;
    inputs.sessionLength = m_stepCount;
    inputs.feedbackHistory = m_feedbackHistory;
    return inputs;
}

QJsonObject ReadingEnvironment::stepInfo(const RewardBreakdown& breakdown) const
{
    QJsonObject info;
    info[QStringLiteral("step")] = m_stepCount;
    info[QStringLiteral("settings")] = m_controls.toJson();
    info[QStringLiteral("reward_breakdown")] = breakdown.toJson();
    return info;
}

} // namespace rt
