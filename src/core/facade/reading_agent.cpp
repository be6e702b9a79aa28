#include "core/facade/reading_agent.h"

#include "core/shared/logging.h"
#include "core/training/training_scheduler.h"

#include <QJsonArray>

namespace rt {

namespace {

QJsonArray toJsonArray(const QVector<double>& values)
{
    QJsonArray arr;
    for (double v : values) {
        arr.append(v);
    }
    return arr;
}

bool checkOptional(const std::optional<double>& value, const QString& field, ValueRange range,
                   ValidationError* errorOut)
{
    if (!value || range.contains(*value)) {
        return true;
    }
    if (errorOut) {
        errorOut->field = field;
        errorOut->value = *value;
        errorOut->range = range;
        errorOut->unbounded = false;
    }
    return false;
}

} // namespace

QJsonObject QueryError::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("kind")] = kind == Kind::Validation
        ? QStringLiteral("validation")
        : QStringLiteral("dimension");
    json[QStringLiteral("message")] = message;
    if (kind == Kind::Validation) {
        json[QStringLiteral("field")] = validation.field;
        json[QStringLiteral("min")] = validation.range.min;
        if (!validation.unbounded) {
            json[QStringLiteral("max")] = validation.range.max;
        }
    }
    return json;
}

QJsonObject QueryResponse::recommendationsJson() const
{
    QJsonObject json;
    json[QStringLiteral("recommended_reading_speed")] = recommendations.readingSpeed;
    json[QStringLiteral("recommended_pause_frequency")] = recommendations.pauseFrequency;
    json[QStringLiteral("recommended_highlight_intensity")] = recommendations.highlightIntensity;
    json[QStringLiteral("recommended_chunk_size")] = recommendations.chunkSize;
    return json;
}

QJsonObject QueryResponse::toJson() const
{
    QJsonObject learning;
    learning[QStringLiteral("reward")] = reward;
    learning[QStringLiteral("state_vector")] = toJsonArray(stateVector);
    learning[QStringLiteral("action")] = toJsonArray(action);

    QJsonObject json;
    json[QStringLiteral("recommendations")] = recommendationsJson();
    json[QStringLiteral("state_analysis")] = stateAnalysis.toJson();
    json[QStringLiteral("reward_breakdown")] = rewardBreakdown.toJson();
    json[QStringLiteral("current_settings")] = currentSettings.toJson();
    json[QStringLiteral("learning_data")] = learning;
    return json;
}

ReadingAgent::ReadingAgent(const Settings& settings)
    : m_settings(settings)
    , m_agent(std::make_unique<ActorCriticAgent>(ActorCriticAgent::Config::fromSettings(settings)))
    , m_stateBuilder(settings.stateDim)
    , m_environment(settings.stateDim, settings.maxEpisodeLength)
{
    m_sessionTracker.startSession();
    m_environment.startSession();
}

ReadingAgent::~ReadingAgent() = default;

void ReadingAgent::attachScheduler(TrainingScheduler* scheduler)
{
    m_scheduler = scheduler;
    m_pending.reset();
}

std::optional<QueryResponse> ReadingAgent::processQuery(const QueryRecord& record, QueryError* errorOut)
{
    ValidationError validation;
    if (!record.validate(&validation)) {
        LOG_WARN(rtCore, "Rejected query: %s", qUtf8Printable(validation.message()));
        if (errorOut) {
            errorOut->kind = QueryError::Kind::Validation;
            errorOut->validation = validation;
            errorOut->message = validation.message();
        }
        return std::nullopt;
    }

    // State and action depend only on the record, so resolve them before
    // anything is written through.
    const StateFeatures features = StateBuilder::featuresFromRecord(record);
    const StateVector state = m_stateBuilder.build(features);

    QString agentError;
    const std::optional<ActionSample> sample = m_agent->getAction(state, false, &agentError);
    if (!sample) {
        LOG_ERROR(rtCore, "Agent rejected state: %s", qUtf8Printable(agentError));
        if (errorOut) {
            errorOut->kind = QueryError::Kind::Dimension;
            errorOut->message = agentError;
        }
        return std::nullopt;
    }

    writeThrough(record);

    QueryResponse response;
    response.stateAnalysis = features;
    response.stateVector = state;
    response.action = sample->rawAction;
    response.recommendations = controlSettingsFromAction(sample->rawAction);
    response.rewardBreakdown = m_environment.rewardBreakdown();
    response.reward = response.rewardBreakdown.totalReward;
    response.currentSettings = m_environment.currentSettings();

    m_settingsHistory.applySettings(response.recommendations, ChangeSource::Agent);

    if (m_scheduler) {
        if (m_pending) {
            // Session completion ends the trajectory once; later turns keep
            // filling length-capped episodes until the session is reset.
            const bool done = m_environment.isSessionComplete() && !m_completionReported;
            m_completionReported = m_completionReported || done;
            m_scheduler->collectExperience(m_pending->state, m_pending->action, response.reward,
                                           state, done);
        }
        m_pending = PendingTransition{state, sample->rawAction};
    }

    ++m_queriesProcessed;
    LOG_DEBUG(rtCore, "Query %d: reward=%.3f speed=%.3f pause=%.3f highlight=%.3f chunk=%.3f",
              m_queriesProcessed, response.reward,
              response.recommendations.readingSpeed, response.recommendations.pauseFrequency,
              response.recommendations.highlightIntensity, response.recommendations.chunkSize);
    return response;
}

void ReadingAgent::writeThrough(const QueryRecord& record)
{
    m_environment.applySettings(record.currentSettings());
    m_environment.setTextFeatures(record.textDifficulty, record.textType, record.textLength);
    m_environment.setUserSignals(record.userEngagement, record.userComprehension);
    m_environment.setRecentCommands(record.recentCommands);
    m_environment.setActionCount(record.actionCount);
    m_environment.updateTextProgress(record.textProgress);
    m_environment.setSessionDuration(record.sessionDuration);
    m_environment.recordInteraction();

    for (const QString& command : record.recentCommands) {
        m_sessionTracker.addCommand(command);
    }
    m_sessionTracker.updateProgress(record.textProgress);

    if (record.hasPreferences()) {
        UserFeedback feedback;
        feedback.preferredSpeed = record.preferredSpeed;
        feedback.preferredPauses = record.preferredPauses;
        feedback.preferredHighlighting = record.preferredHighlighting;
        m_environment.updateUserFeedback(feedback);
    }
}

bool ReadingAgent::updateUserFeedback(const UserFeedback& feedback, ValidationError* errorOut)
{
    if (!checkOptional(feedback.comprehension, QStringLiteral("comprehension"), kUnitRange, errorOut)
        || !checkOptional(feedback.engagement, QStringLiteral("engagement"), kUnitRange, errorOut)
        || !checkOptional(feedback.preferredSpeed, QStringLiteral("preferred_speed"),
                          kReadingSpeedRange, errorOut)
        || !checkOptional(feedback.preferredPauses, QStringLiteral("preferred_pauses"),
                          kPauseFrequencyRange, errorOut)
        || !checkOptional(feedback.preferredHighlighting, QStringLiteral("preferred_highlighting"),
                          kHighlightIntensityRange, errorOut)) {
        return false;
    }
    m_environment.updateUserFeedback(feedback);
    return true;
}

bool ReadingAgent::updateSetting(ControlSetting setting, double value, ValidationError* errorOut)
{
    const ValueRange range = controlSettingRange(setting);
    if (!range.contains(value)) {
        if (errorOut) {
            errorOut->field = controlSettingToString(setting);
            errorOut->value = value;
            errorOut->range = range;
            errorOut->unbounded = false;
        }
        return false;
    }

    ControlSettings current = m_environment.currentSettings();
    current.setValue(setting, value);
    m_environment.applySettings(current);
    m_settingsHistory.applyChange(setting, value, ChangeSource::UserOverride);
    return true;
}

void ReadingAgent::resetSession()
{
    const ControlSettings kept = m_environment.currentSettings();
    if (!m_environment.endSession()) {
        LOG_DEBUG(rtCore, "No open session to close");
    }
    m_environment.reset();
    m_environment.applySettings(kept);
    m_environment.setRecentCommands(QStringList());
    m_environment.setSessionDuration(0.0);
    m_environment.startSession();

    m_sessionTracker.endSession();
    m_sessionTracker.startSession();
    m_pending.reset();
    m_completionReported = false;
    LOG_INFO(rtCore, "Reading session reset");
}

bool ReadingAgent::loadModel(QString* errorOut)
{
    return m_agent->load(m_settings.resolvedModelPath(), errorOut);
}

bool ReadingAgent::saveModel(QString* errorOut) const
{
    return m_agent->save(m_settings.resolvedModelPath(), errorOut);
}

} // namespace rt
