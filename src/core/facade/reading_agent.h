#pragma once

#include "core/agent/actor_critic_agent.h"
#include "core/environment/reading_environment.h"
#include "core/session/session_tracker.h"
#include "core/session/settings_history.h"
#include "core/shared/query_record.h"
#include "core/shared/settings.h"
#include "core/state/state_builder.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>

namespace rt {

class TrainingScheduler;

struct QueryError {
    enum class Kind {
        Validation,
        Dimension,
    };

    Kind kind = Kind::Validation;
    QString message;
    ValidationError validation;  // set for Kind::Validation

    QJsonObject toJson() const;
};

struct QueryResponse {
    ControlSettings recommendations;
    StateFeatures stateAnalysis;
    RewardBreakdown rewardBreakdown;
    ControlSettings currentSettings;
    double reward = 0.0;
    StateVector stateVector;
    ActionVector action;

    QJsonObject recommendationsJson() const;
    QJsonObject toJson() const;
};

// Single entry point for the voice/tool layer: one QueryRecord in, one set of
// bounded recommendations out. Owns the agent, environment and trackers.
class ReadingAgent {
public:
    explicit ReadingAgent(const Settings& settings = Settings());
    ~ReadingAgent();

    ReadingAgent(const ReadingAgent&) = delete;
    ReadingAgent& operator=(const ReadingAgent&) = delete;

    std::optional<QueryResponse> processQuery(const QueryRecord& record,
                                              QueryError* errorOut = nullptr);

    bool updateUserFeedback(const UserFeedback& feedback, ValidationError* errorOut = nullptr);
    bool updateSetting(ControlSetting setting, double value, ValidationError* errorOut = nullptr);
    void resetSession();

    // Every processed query after the first feeds (previous state, previous
    // action, current reward, current state) to the scheduler. Pass null to detach.
    void attachScheduler(TrainingScheduler* scheduler);

    bool loadModel(QString* errorOut = nullptr);
    bool saveModel(QString* errorOut = nullptr) const;

    ActorCriticAgent& agent() { return *m_agent; }
    ReadingEnvironment& environment() { return m_environment; }
    const ReadingEnvironment& environment() const { return m_environment; }
    SessionTracker& sessionTracker() { return m_sessionTracker; }
    SettingsHistory& settingsHistory() { return m_settingsHistory; }
    const SettingsHistory& settingsHistory() const { return m_settingsHistory; }
    int queriesProcessed() const { return m_queriesProcessed; }

private:
    void writeThrough(const QueryRecord& record);

    Settings m_settings;
    std::unique_ptr<ActorCriticAgent> m_agent;
    StateBuilder m_stateBuilder;
    ReadingEnvironment m_environment;
    SessionTracker m_sessionTracker;
    SettingsHistory m_settingsHistory;
    TrainingScheduler* m_scheduler = nullptr;

    struct PendingTransition {
        StateVector state;
        ActionVector action;
    };
    std::optional<PendingTransition> m_pending;
    bool m_completionReported = false;
    int m_queriesProcessed = 0;
};

} // namespace rt
