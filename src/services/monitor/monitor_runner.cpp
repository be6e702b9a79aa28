#include "monitor_runner.h"

#include "core/facade/reading_agent.h"
#include "core/shared/logging.h"
#include "core/state/text_analyzer.h"
#include "core/training/training_scheduler.h"
#include "core/training/training_store.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

#include <algorithm>
#include <optional>

namespace rt {

MonitorRunner::MonitorRunner(Settings settings, Options options)
    : m_settings(std::move(settings))
    , m_options(options)
{
}

QVector<MonitorScenario> MonitorRunner::defaultScenarios()
{
    return {
        {QStringLiteral("simple_email"),
         QStringLiteral("Dear team, the meeting moved to Friday. Sincerely, Ana"),
         {}},
        {QStringLiteral("academic_text"),
         QStringLiteral("Chapter 4 compares policy gradient estimators. As shown in Figure 2 and "
                        "Table 3, variance reduction through learned baselines substantially "
                        "improves sample efficiency across continuous control benchmarks."),
         {QStringLiteral("explain")}},
        {QStringLiteral("speed_request"),
         QStringLiteral("That is too slow, can you speak faster please?"),
         {QStringLiteral("faster")}},
        {QStringLiteral("confused_listener"),
         QStringLiteral("I am confused about this part. Why does the value estimate lag behind?"),
         {QStringLiteral("repeat"), QStringLiteral("slower"), QStringLiteral("confused")}},
        {QStringLiteral("engaged_listener"),
         QStringLiteral("Yes, that makes sense and it is very helpful. Please continue."),
         {QStringLiteral("continue"), QStringLiteral("got it")}},
        {QStringLiteral("breaking_news"),
         QStringLiteral("Breaking: officials reported early results, according to sources close "
                        "to the count. More updates are expected tonight."),
         {QStringLiteral("more")}},
    };
}

int MonitorRunner::run()
{
    QTextStream out(stdout);

    std::optional<TrainingStore> store = TrainingStore::open(m_settings.resolvedDbPath());
    if (!store) {
        LOG_WARN(rtCore, "Training store unavailable at %s; running without persistence",
                 qUtf8Printable(m_settings.resolvedDbPath()));
    }

    ReadingAgent reader(m_settings);
    QString loadError;
    if (!reader.loadModel(&loadError)) {
        LOG_INFO(rtCore, "Starting from fresh weights (%s)", qUtf8Printable(loadError));
    }

    TrainingScheduler scheduler(&reader.agent(), store ? &*store : nullptr,
                                TrainingScheduler::Config::fromSettings(m_settings));
    if (!scheduler.initialize()) {
        LOG_WARN(rtCore, "Could not restore training stats");
    }

    const QVector<MonitorScenario> scenarios = defaultScenarios();
    QJsonArray episodeRewards;
    int rejected = 0;

    for (int episode = 0; episode < std::max(m_options.episodes, 1); ++episode) {
        reader.resetSession();
        double episodeReward = 0.0;
        ControlSettings applied = reader.environment().currentSettings();

        for (int i = 0; i < scenarios.size(); ++i) {
            const MonitorScenario& scenario = scenarios.at(i);
            reader.sessionTracker().updateProgress(
                static_cast<double>(i + 1) / static_cast<double>(scenarios.size()));

            QueryRecord observed;
            observed.textDifficulty = TextAnalyzer::difficulty(scenario.text);
            observed.textType = TextAnalyzer::textType(scenario.text);
            observed.textLength = TextAnalyzer::normalizedLength(scenario.text);
            observed.userEngagement = TextAnalyzer::engagementFromCommands(scenario.commands);
            observed.userComprehension = TextAnalyzer::comprehensionFromCommands(scenario.commands);
            observed.textProgress = reader.sessionTracker().progress();
            observed.currentReadingSpeed = applied.readingSpeed;
            observed.currentPauseFrequency = applied.pauseFrequency;
            observed.currentHighlightIntensity = applied.highlightIntensity;
            observed.currentChunkSize = applied.chunkSize;

            // The facade appends the record's commands to the tracker.
            QueryOverrides overrides;
            overrides.recentCommands = scenario.commands;

            ValidationError validation;
            const std::optional<QueryRecord> record =
                reader.sessionTracker().createQueryRecord(observed, overrides, &validation);
            if (!record) {
                LOG_WARN(rtCore, "Scenario %s rejected: %s", qUtf8Printable(scenario.name),
                         qUtf8Printable(validation.message()));
                ++rejected;
                continue;
            }

            QueryError error;
            const std::optional<QueryResponse> response = reader.processQuery(*record, &error);
            if (!response) {
                LOG_WARN(rtCore, "Scenario %s failed: %s", qUtf8Printable(scenario.name),
                         qUtf8Printable(error.message));
                ++rejected;
                continue;
            }

            const bool last = i == scenarios.size() - 1;
            scheduler.collectExperience(response->stateVector, response->action, response->reward,
                                        response->stateVector, last);
            episodeReward += response->reward;
            applied = response->recommendations;

            LOG_INFO(rtCore, "[%d] %s: reward=%.3f speed=%.2f pause=%.2f highlight=%.2f chunk=%.2f",
                     episode, qUtf8Printable(scenario.name), response->reward,
                     applied.readingSpeed, applied.pauseFrequency,
                     applied.highlightIntensity, applied.chunkSize);
        }
        episodeRewards.append(episodeReward);
    }

    bool trained = false;
    if (m_options.train) {
        trained = scheduler.forceTraining();
        if (trained) {
            QString saveError;
            if (!reader.saveModel(&saveError)) {
                LOG_WARN(rtCore, "Could not save weights: %s", qUtf8Printable(saveError));
            }
        }
    }
    scheduler.stop();

    m_report = QJsonObject();
    m_report[QStringLiteral("episodes")] = std::max(m_options.episodes, 1);
    m_report[QStringLiteral("episode_rewards")] = episodeRewards;
    m_report[QStringLiteral("rejected_queries")] = rejected;
    m_report[QStringLiteral("training_requested")] = m_options.train;
    m_report[QStringLiteral("training_ran")] = trained;
    m_report[QStringLiteral("status")] = scheduler.status().toJson();
    m_report[QStringLiteral("suggestions")] = QJsonArray::fromStringList(scheduler.dataCollectionSuggestions());
    m_report[QStringLiteral("should_collect_more_data")] = scheduler.shouldCollectMoreData();

    out << QJsonDocument(m_report).toJson(QJsonDocument::Indented);
    out.flush();
    return rejected == 0 ? 0 : 1;
}

} // namespace rt
