#pragma once

#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/training/episode.h"
#include "core/training/training_stats.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace rt {

class ActorCriticAgent;
class TrainingStore;

// Buffers live experience into episodes and trains the agent on a timer or on
// demand. All mutable state sits behind one mutex; training passes are rare
// enough that holding it across a pass is fine.
class TrainingScheduler {
public:
    struct Config {
        int trainingIntervalSec = 300;
        int maxEpisodeLength = 50;
        int maxRetainedEpisodes = 10;
        int minEpisodesForTraining = 2;
        int rewardWindow = 100;
        int persistedEpisodeSample = 5;

        static Config fromSettings(const Settings& settings);
    };

    struct BufferSizes {
        int states = 0;
        int actions = 0;
        int rewards = 0;
        int episodes = 0;
    };

    struct Status {
        int episodesCollected = 0;
        long long totalTrainingSteps = 0;
        double averageReward = 0.0;
        QDateTime lastTrainingTime;
        bool dataCollectionActive = false;
        BufferSizes bufferSizes;
        double timeSinceLastTraining = 0.0;  // seconds
        double nextTrainingIn = 0.0;         // seconds
        double lastPolicyLoss = 0.0;
        double lastBaselineLoss = 0.0;
        QString lastTrainingReason;
        int persistFailures = 0;
        QString lastPersistError;
        int droppedTransitions = 0;

        QJsonObject toJson() const;
    };

    // agent must outlive the scheduler; store may be null (no persistence).
    TrainingScheduler(ActorCriticAgent* agent, TrainingStore* store, const Config& config = Config());
    ~TrainingScheduler();

    TrainingScheduler(const TrainingScheduler&) = delete;
    TrainingScheduler& operator=(const TrainingScheduler&) = delete;

    // Restores persisted stats. Returns false only when the store is present
    // and reading it failed.
    bool initialize();

    bool start();
    void stop();
    bool isRunning() const;

    // Transitions whose lengths do not match the agent are dropped and counted.
    void collectExperience(const StateVector& state,
                           const ActionVector& action,
                           double reward,
                           const StateVector& nextState,
                           bool done);

    bool performTraining(QString* reasonOut = nullptr);
    bool forceTraining();

    Status status() const;
    TrainingStats stats() const;
    QStringList dataCollectionSuggestions() const;
    bool shouldCollectMoreData() const;

    int episodeCount() const;
    int bufferSize() const;
    QVector<Episode> episodes() const;

private:
    void runLoop();
    void packageEpisodeUnlocked();
    void trimEpisodesUnlocked();
    bool performTrainingUnlocked(const QString& trigger, QString* reasonOut);
    bool persistUnlocked(QString* errorOut);
    double averageRewardUnlocked() const;
    double secondsSinceLastTrainingUnlocked() const;
    BufferSizes bufferSizesUnlocked() const;

    ActorCriticAgent* m_agent;
    TrainingStore* m_store;
    Config m_config;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    bool m_running = false;
    bool m_stopRequested = false;

    QVector<StateVector> m_states;
    QVector<ActionVector> m_actions;
    QVector<double> m_rewards;

    QVector<Episode> m_episodes;
    QVector<Episode> m_unpersistedEpisodes;
    std::deque<double> m_recentRewards;

    TrainingStats m_stats;
    QDateTime m_createdAt;
    QString m_lastTrainingReason;
    int m_persistFailures = 0;
    QString m_lastPersistError;
    int m_droppedTransitions = 0;
    bool m_persistPending = false;
    int m_batchCounter = 0;
};

} // namespace rt
