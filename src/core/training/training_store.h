#pragma once

#include "core/training/episode.h"
#include "core/training/training_stats.h"

#include <QDateTime>
#include <QString>
#include <QVector>

#include <cstdint>
#include <optional>

#include <sqlite3.h>

namespace rt {

struct EpisodeSummary {
    int64_t id = 0;
    QString batchId;
    int episodeLength = 0;
    double totalReward = 0.0;
    QDateTime timestamp;
    QVector<double> rewards;
};

// TrainingStore: owner of the training database. Holds the stats snapshot as
// key/value rows and the per-pass episode summaries.
class TrainingStore {
public:
    ~TrainingStore();

    // Move-only (owns sqlite3* handle)
    TrainingStore(TrainingStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    TrainingStore& operator=(TrainingStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    TrainingStore(const TrainingStore&) = delete;
    TrainingStore& operator=(const TrainingStore&) = delete;

    // Opens or creates the database and its schema.
    static std::optional<TrainingStore> open(const QString& dbPath);

    bool saveStats(const TrainingStats& stats, QString* errorOut = nullptr);
    std::optional<TrainingStats> loadStats() const;

    // Writes all episodes in one transaction under a shared batch id.
    bool saveEpisodeSummaries(const QVector<Episode>& episodes,
                              const QString& batchId,
                              QString* errorOut = nullptr);
    QVector<EpisodeSummary> episodeSummaries(int limit = 100) const;
    int episodeSummaryCount() const;

    sqlite3* rawDb() const { return m_db; }

private:
    TrainingStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql, QString* errorOut = nullptr);
    void rollback();
    bool setStat(const QString& key, const QString& value, QString* errorOut);

    sqlite3* m_db = nullptr;
};

} // namespace rt
