#pragma once

#include "core/environment/reward_model.h"
#include "core/shared/types.h"
#include "core/state/state_builder.h"
#include "core/state/text_analyzer.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

namespace rt {

struct SessionRecord {
    int sessionId = 0;
    QDateTime startTime;
    QDateTime endTime;
    ControlSettings initialSettings;
    ControlSettings finalSettings;
    double durationSeconds = 0.0;
    int steps = 0;

    bool isOpen() const { return !endTime.isValid(); }
    QJsonObject toJson() const;
};

struct ResetResult {
    StateVector state;
    QJsonObject info;
};

struct StepResult {
    StateVector nextState;
    double reward = 0.0;
    bool done = false;
    bool truncated = false;
    RewardBreakdown breakdown;
    QJsonObject info;
};

// Owns the live delivery controls and the listener signals the reward reads.
// Not thread-safe; driven from the caller's thread only.
class ReadingEnvironment {
public:
    static constexpr int kMaxSessionSteps = 50;
    static constexpr int kMaxRecentCommands = 10;
    static constexpr int kMaxFeedbackHistory = 50;

    explicit ReadingEnvironment(int stateDim = kDefaultStateDim,
                                int maxSessionSteps = kMaxSessionSteps);

    ResetResult reset();
    StepResult step(const ActionVector& action);

    // Counts one observed interaction without applying an action.
    void recordInteraction();

    void applySettings(const ControlSettings& settings);
    ControlSettings currentSettings() const { return m_controls; }

    void setTextFeatures(double difficulty, double type, double length);
    void setTextContent(const QString& text);
    QString textContent() const { return m_textContent; }
    void updateTextProgress(double progress);

    void setUserSignals(double engagement, double comprehension);
    void addCommand(const QString& command);
    void setRecentCommands(const QStringList& commands);
    void setActionCount(int actionCount);
    void setSessionDuration(double seconds);

    // Keeps the kMaxFeedbackHistory most recent entries.
    void updateUserFeedback(const UserFeedback& feedback);
    QVector<UserFeedback> feedbackHistory() const { return m_feedbackHistory; }

    int startSession();
    bool endSession(SessionRecord* recordOut = nullptr);
    QVector<SessionRecord> sessions() const { return m_sessions; }
    int sessionCount() const { return m_sessions.size(); }

    StateFeatures currentFeatures() const;
    StateVector currentState() const;
    RewardBreakdown rewardBreakdown() const;
    double computeReward() const { return rewardBreakdown().totalReward; }

    bool isSessionComplete() const { return m_stepCount > m_maxSessionSteps; }
    int stepCount() const { return m_stepCount; }
    int stateDim() const { return m_stateBuilder.stateDim(); }
    double textDifficulty() const { return m_textDifficulty; }
    double userEngagement() const { return m_userEngagement; }
    double userComprehension() const { return m_userComprehension; }
    double textProgress() const { return m_textProgress; }
    double sessionDuration() const { return m_sessionDuration; }
    QStringList recentCommands() const { return m_recentCommands; }

private:
    RewardInputs rewardInputs() const;
    QJsonObject stepInfo(const RewardBreakdown& breakdown) const;

    StateBuilder m_stateBuilder;
    int m_maxSessionSteps;

    ControlSettings m_controls;

    QString m_textContent;
    double m_textDifficulty = 0.5;
    double m_textType = TextAnalyzer::kGeneralType;
    double m_textLength = 0.5;
    double m_textProgress = 0.0;

    double m_userEngagement = 0.5;
    double m_userComprehension = 0.5;
    QStringList m_recentCommands;
    int m_actionCount = 0;
    double m_sessionDuration = 0.0;

    int m_stepCount = 0;
    QVector<UserFeedback> m_feedbackHistory;
    QVector<SessionRecord> m_sessions;
};

} // namespace rt
