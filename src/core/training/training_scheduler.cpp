#include "core/training/training_scheduler.h"

#include "core/agent/actor_critic_agent.h"
#include "core/shared/logging.h"
#include "core/training/training_store.h"

#include <QJsonArray>

#include <algorithm>
#include <chrono>
#include <numeric>

namespace rt {

namespace {

constexpr int kSuggestMinEpisodes = 5;
constexpr double kSuggestMinAverageReward = 0.5;
constexpr int kSuggestMinBufferLength = 10;
constexpr int kCollectMinEpisodes = 10;
constexpr double kCollectMinAverageReward = 1.0;

} // namespace

TrainingScheduler::Config TrainingScheduler::Config::fromSettings(const Settings& settings)
{
    Config config;
    config.trainingIntervalSec = settings.trainingIntervalSec;
    config.maxEpisodeLength = settings.maxEpisodeLength;
    config.maxRetainedEpisodes = settings.maxRetainedEpisodes;
    config.minEpisodesForTraining = settings.minEpisodesForTraining;
    config.rewardWindow = settings.rewardWindow;
    config.persistedEpisodeSample = settings.persistedEpisodeSample;
    return config;
}

QJsonObject TrainingScheduler::Status::toJson() const
{
    QJsonObject buffers;
    buffers[QStringLiteral("states")] = bufferSizes.states;
    buffers[QStringLiteral("actions")] = bufferSizes.actions;
    buffers[QStringLiteral("rewards")] = bufferSizes.rewards;
    buffers[QStringLiteral("episodes")] = bufferSizes.episodes;

    QJsonObject json;
    json[QStringLiteral("episodes_collected")] = episodesCollected;
    json[QStringLiteral("total_training_steps")] = static_cast<double>(totalTrainingSteps);
    json[QStringLiteral("average_reward")] = averageReward;
    json[QStringLiteral("last_training_time")] = lastTrainingTime.isValid()
        ? QJsonValue(lastTrainingTime.toString(Qt::ISODateWithMs))
        : QJsonValue();
    json[QStringLiteral("data_collection_active")] = dataCollectionActive;
    json[QStringLiteral("buffer_sizes")] = buffers;
    json[QStringLiteral("time_since_last_training")] = timeSinceLastTraining;
    json[QStringLiteral("next_training_in")] = nextTrainingIn;
    json[QStringLiteral("last_policy_loss")] = lastPolicyLoss;
    json[QStringLiteral("last_baseline_loss")] = lastBaselineLoss;
    json[QStringLiteral("last_training_reason")] = lastTrainingReason;
    json[QStringLiteral("persist_failures")] = persistFailures;
    json[QStringLiteral("last_persist_error")] = lastPersistError;
    json[QStringLiteral("dropped_transitions")] = droppedTransitions;
    return json;
}

TrainingScheduler::TrainingScheduler(ActorCriticAgent* agent, TrainingStore* store, const Config& config)
    : m_agent(agent)
    , m_store(store)
    , m_config(config)
    , m_createdAt(QDateTime::currentDateTimeUtc())
{
    m_config.maxEpisodeLength = std::max(m_config.maxEpisodeLength, 1);
    m_config.maxRetainedEpisodes = std::max(m_config.maxRetainedEpisodes, 1);
    m_config.rewardWindow = std::max(m_config.rewardWindow, 1);
    m_config.trainingIntervalSec = std::max(m_config.trainingIntervalSec, 1);
}

TrainingScheduler::~TrainingScheduler()
{
    stop();
}

bool TrainingScheduler::initialize()
{
    if (!m_store) {
        return true;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const std::optional<TrainingStats> persisted = m_store->loadStats();
    if (persisted) {
        m_stats = *persisted;
        LOG_INFO(rtTraining, "Restored training stats: episodes=%d steps=%lld",
                 m_stats.episodesCollected, m_stats.totalTrainingSteps);
    }
    return true;
}

bool TrainingScheduler::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        return false;
    }
    m_stopRequested = false;
    m_running = true;
    m_thread = std::thread([this] { runLoop(); });
    LOG_INFO(rtTraining, "Training loop started (interval %ds)", m_config.trainingIntervalSec);
    return true;
}

void TrainingScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const bool wasRunning = m_running;
    m_running = false;

    // Shutdown ends the current trajectory.
    if (!m_rewards.isEmpty()) {
        packageEpisodeUnlocked();
    }
    if (!m_unpersistedEpisodes.isEmpty() || m_persistPending || wasRunning) {
        QString error;
        if (!persistUnlocked(&error)) {
            LOG_WARN(rtTraining, "Flush on stop failed: %s", qUtf8Printable(error));
        }
    }
    if (wasRunning) {
        LOG_INFO(rtTraining, "Training loop stopped");
    }
}

bool TrainingScheduler::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

void TrainingScheduler::runLoop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopRequested) {
        m_cv.wait_for(lock, std::chrono::seconds(m_config.trainingIntervalSec),
                      [this] { return m_stopRequested; });
        if (m_stopRequested) {
            break;
        }
        QString reason;
        if (!performTrainingUnlocked(QStringLiteral("scheduled"), &reason)) {
            LOG_DEBUG(rtTraining, "Scheduled pass skipped: %s", qUtf8Printable(reason));
        }
    }
}

void TrainingScheduler::collectExperience(const StateVector& state,
                                          const ActionVector& action,
                                          double reward,
                                          const StateVector& nextState,
                                          bool done)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_agent) {
        const int stateDim = m_agent->stateDim();
        if (state.size() != stateDim || nextState.size() != stateDim
            || action.size() != m_agent->actionDim()) {
            ++m_droppedTransitions;
            LOG_WARN(rtTraining, "Dropped transition: state=%d next=%d action=%d, expected %d/%d",
                     int(state.size()), int(nextState.size()), int(action.size()),
                     stateDim, m_agent->actionDim());
            return;
        }
    }

    m_states.append(state);
    m_actions.append(action);
    m_rewards.append(reward);

    m_recentRewards.push_back(reward);
    while (static_cast<int>(m_recentRewards.size()) > m_config.rewardWindow) {
        m_recentRewards.pop_front();
    }
    m_stats.averageReward = averageRewardUnlocked();

    if (done || m_rewards.size() >= m_config.maxEpisodeLength) {
        packageEpisodeUnlocked();
    }
}

void TrainingScheduler::packageEpisodeUnlocked()
{
    Episode episode;
    episode.states = std::move(m_states);
    episode.actions = std::move(m_actions);
    episode.rewards = std::move(m_rewards);
    episode.timestamp = QDateTime::currentDateTimeUtc();
    m_states.clear();
    m_actions.clear();
    m_rewards.clear();

    ++m_stats.episodesCollected;
    LOG_DEBUG(rtTraining, "Packaged episode: length=%d reward=%.3f",
              episode.length(), episode.totalReward());

    m_unpersistedEpisodes.append(episode);
    while (m_unpersistedEpisodes.size() > m_config.maxRetainedEpisodes) {
        m_unpersistedEpisodes.removeFirst();
    }
    m_episodes.append(std::move(episode));
    trimEpisodesUnlocked();
}

bool TrainingScheduler::performTraining(QString* reasonOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return performTrainingUnlocked(QStringLiteral("manual"), reasonOut);
}

bool TrainingScheduler::forceTraining()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_episodes.isEmpty()) {
        LOG_INFO(rtTraining, "Forced training requested with no episodes");
        return false;
    }
    QString reason;
    if (!performTrainingUnlocked(QStringLiteral("forced"), &reason)) {
        LOG_INFO(rtTraining, "Forced training did not run: %s", qUtf8Printable(reason));
    }
    return true;
}

bool TrainingScheduler::performTrainingUnlocked(const QString& trigger, QString* reasonOut)
{
    auto reject = [this, reasonOut](const QString& reason) {
        m_lastTrainingReason = reason;
        if (reasonOut) {
            *reasonOut = reason;
        }
        return false;
    };

    if (!m_agent) {
        return reject(QStringLiteral("no_agent"));
    }
    if (m_episodes.size() < m_config.minEpisodesForTraining) {
        return reject(QStringLiteral("insufficient_episodes"));
    }

    QVector<StateVector> states;
    QVector<ActionVector> actions;
    QVector<double> rewards;
    for (const Episode& episode : m_episodes) {
        states += episode.states;
        actions += episode.actions;
        rewards += episode.rewards;
    }

    QString error;
    const std::optional<TrainLosses> losses = m_agent->train(states, actions, rewards, &error);
    if (!losses) {
        LOG_WARN(rtTraining, "Training pass failed: %s", qUtf8Printable(error));
        return reject(error);
    }

    ++m_stats.totalTrainingSteps;
    m_stats.lastTrainingTime = QDateTime::currentDateTimeUtc();
    m_stats.lastPolicyLoss = losses->policyLoss;
    m_stats.lastBaselineLoss = losses->baselineLoss;
    m_lastTrainingReason = trigger;
    if (reasonOut) {
        *reasonOut = trigger;
    }

    LOG_INFO(rtTraining, "Training pass %lld (%s): episodes=%d steps=%d policy=%.4f baseline=%.4f",
             m_stats.totalTrainingSteps, qUtf8Printable(trigger), int(m_episodes.size()),
             losses->steps, losses->policyLoss, losses->baselineLoss);

    QString persistError;
    if (!persistUnlocked(&persistError)) {
        LOG_WARN(rtTraining, "Persisting training results failed, will retry: %s",
                 qUtf8Printable(persistError));
    }

    return true;
}

void TrainingScheduler::trimEpisodesUnlocked()
{
    while (m_episodes.size() > m_config.maxRetainedEpisodes) {
        m_episodes.removeFirst();
    }
}

bool TrainingScheduler::persistUnlocked(QString* errorOut)
{
    if (!m_store) {
        m_unpersistedEpisodes.clear();
        m_persistPending = false;
        return true;
    }

    QString error;
    if (!m_store->saveStats(m_stats, &error)) {
        ++m_persistFailures;
        m_lastPersistError = error;
        m_persistPending = true;
        if (errorOut) {
            *errorOut = error;
        }
        return false;
    }

    const int sample = std::max(m_config.persistedEpisodeSample, 0);
    const QVector<Episode> recent = m_unpersistedEpisodes.mid(
        std::max(0, int(m_unpersistedEpisodes.size()) - sample));
    const QString batchId = QStringLiteral("batch_%1_%2")
        .arg(QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMddhhmmsszzz")))
        .arg(++m_batchCounter);
    if (!m_store->saveEpisodeSummaries(recent, batchId, &error)) {
        ++m_persistFailures;
        m_lastPersistError = error;
        m_persistPending = true;
        if (errorOut) {
            *errorOut = error;
        }
        return false;
    }

    m_unpersistedEpisodes.clear();
    m_persistPending = false;
    LOG_DEBUG(rtTraining, "Persisted stats and %d episode summaries", int(recent.size()));
    return true;
}

double TrainingScheduler::averageRewardUnlocked() const
{
    if (m_recentRewards.empty()) {
        return 0.0;
    }
    const double sum = std::accumulate(m_recentRewards.cbegin(), m_recentRewards.cend(), 0.0);
    return sum / static_cast<double>(m_recentRewards.size());
}

double TrainingScheduler::secondsSinceLastTrainingUnlocked() const
{
    const QDateTime reference = m_stats.lastTrainingTime.isValid()
        ? m_stats.lastTrainingTime
        : m_createdAt;
    return std::max<qint64>(0, reference.msecsTo(QDateTime::currentDateTimeUtc())) / 1000.0;
}

TrainingScheduler::BufferSizes TrainingScheduler::bufferSizesUnlocked() const
{
    BufferSizes sizes;
    sizes.states = m_states.size();
    sizes.actions = m_actions.size();
    sizes.rewards = m_rewards.size();
    sizes.episodes = m_episodes.size();
    return sizes;
}

TrainingScheduler::Status TrainingScheduler::status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Status status;
    status.episodesCollected = m_stats.episodesCollected;
    status.totalTrainingSteps = m_stats.totalTrainingSteps;
    status.averageReward = m_stats.averageReward;
    status.lastTrainingTime = m_stats.lastTrainingTime;
    status.dataCollectionActive = m_running;
    status.bufferSizes = bufferSizesUnlocked();
    status.timeSinceLastTraining = secondsSinceLastTrainingUnlocked();
    status.nextTrainingIn = std::max(0.0, m_config.trainingIntervalSec - status.timeSinceLastTraining);
    status.lastPolicyLoss = m_stats.lastPolicyLoss;
    status.lastBaselineLoss = m_stats.lastBaselineLoss;
    status.lastTrainingReason = m_lastTrainingReason;
    status.persistFailures = m_persistFailures;
    status.lastPersistError = m_lastPersistError;
    status.droppedTransitions = m_droppedTransitions;
    return status;
}

TrainingStats TrainingScheduler::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

QStringList TrainingScheduler::dataCollectionSuggestions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QStringList suggestions;
    if (m_stats.episodesCollected < kSuggestMinEpisodes) {
        suggestions << QStringLiteral("Collect more episodes before relying on training results");
    }
    if (m_stats.averageReward < kSuggestMinAverageReward) {
        suggestions << QStringLiteral("Average reward is low; review the current reading settings");
    }
    if (m_rewards.size() < kSuggestMinBufferLength) {
        suggestions << QStringLiteral("Current episode is short; keep the session going");
    }
    if (secondsSinceLastTrainingUnlocked() > m_config.trainingIntervalSec) {
        suggestions << QStringLiteral("Training is overdue; consider forcing a training pass");
    }

    suggestions << QStringLiteral("Mix text types: emails, articles and academic papers")
                << QStringLiteral("Vary text difficulty between sessions")
                << QStringLiteral("Use voice commands to give feedback while listening")
                << QStringLiteral("Include both engaged and confused listener responses");
    return suggestions;
}

bool TrainingScheduler::shouldCollectMoreData() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stats.episodesCollected < kCollectMinEpisodes) {
        return true;
    }
    if (m_stats.averageReward < kCollectMinAverageReward) {
        return true;
    }
    return secondsSinceLastTrainingUnlocked() > 2.0 * m_config.trainingIntervalSec;
}

int TrainingScheduler::episodeCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_episodes.size();
}

int TrainingScheduler::bufferSize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rewards.size();
}

QVector<Episode> TrainingScheduler::episodes() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_episodes;
}

} // namespace rt
