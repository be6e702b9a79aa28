#include "core/training/training_store.h"

#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>

namespace rt {

namespace {

constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA journal_mode = WAL;
)";

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS training_stats (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS episode_summaries (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    batch_id TEXT NOT NULL,
    episode_length INTEGER NOT NULL,
    total_reward REAL NOT NULL,
    timestamp REAL NOT NULL,
    rewards_json TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_episode_summaries_batch ON episode_summaries(batch_id);
)";

QString formatDouble(double value)
{
    return QString::number(value, 'g', 17);
}

QString rewardsToJson(const QVector<double>& rewards)
{
    QJsonArray arr;
    for (double r : rewards) {
        arr.append(r);
    }
    return QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Compact));
}

QVector<double> rewardsFromJson(const QString& encoded)
{
    QVector<double> out;
    const QJsonDocument doc = QJsonDocument::fromJson(encoded.toUtf8());
    if (!doc.isArray()) {
        return out;
    }
    const QJsonArray arr = doc.array();
    out.reserve(arr.size());
    for (const QJsonValue& value : arr) {
        out.push_back(value.toDouble(0.0));
    }
    return out;
}

} // namespace

TrainingStore::~TrainingStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<TrainingStore> TrainingStore::open(const QString& dbPath)
{
    TrainingStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool TrainingStore::init(const QString& dbPath)
{
    QDir().mkpath(QFileInfo(dbPath).absolutePath());

    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rtStore, "Failed to open training database: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(rtStore, "Failed to set connection pragmas");
        return false;
    }
    if (!execSql(kSchema)) {
        LOG_ERROR(rtStore, "Failed to create training schema");
        return false;
    }

    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(rtStore, "Training database opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool TrainingStore::execSql(const char* sql, QString* errorOut)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        LOG_ERROR(rtStore, "SQL error: %s", qUtf8Printable(message));
        if (errorOut) {
            *errorOut = message;
        }
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void TrainingStore::rollback()
{
    if (!execSql("ROLLBACK")) {
        LOG_WARN(rtStore, "Rollback failed");
    }
}

bool TrainingStore::setStat(const QString& key, const QString& value, QString* errorOut)
{
    static constexpr const char* kSql = R"(
        INSERT INTO training_stats (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        if (errorOut) {
            *errorOut = QString::fromUtf8(sqlite3_errmsg(m_db));
        }
        return false;
    }

    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valueUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, valueUtf8.constData(), -1, SQLITE_TRANSIENT);
    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok && errorOut) {
        *errorOut = QString::fromUtf8(sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return ok;
}

bool TrainingStore::saveStats(const TrainingStats& stats, QString* errorOut)
{
    if (!execSql("BEGIN IMMEDIATE", errorOut)) {
        return false;
    }

    const QString lastTraining = stats.lastTrainingTime.isValid()
        ? QString::number(stats.lastTrainingTime.toMSecsSinceEpoch())
        : QString();

    const bool ok = setStat(QStringLiteral("episodes_collected"),
                            QString::number(stats.episodesCollected), errorOut)
        && setStat(QStringLiteral("total_training_steps"),
                   QString::number(stats.totalTrainingSteps), errorOut)
        && setStat(QStringLiteral("average_reward"), formatDouble(stats.averageReward), errorOut)
        && setStat(QStringLiteral("last_training_time_ms"), lastTraining, errorOut)
        && setStat(QStringLiteral("last_policy_loss"), formatDouble(stats.lastPolicyLoss), errorOut)
        && setStat(QStringLiteral("last_baseline_loss"), formatDouble(stats.lastBaselineLoss), errorOut);

    if (!ok) {
        LOG_WARN(rtStore, "Failed to save training stats; rolling back");
        rollback();
        return false;
    }
    return execSql("COMMIT", errorOut);
}

std::optional<TrainingStats> TrainingStore::loadStats() const
{
    static constexpr const char* kSql = "SELECT key, value FROM training_stats";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    TrainingStats stats;
    int rows = 0;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ++rows;
        const QString key = QString::fromUtf8(
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        const QString value = QString::fromUtf8(
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));

        if (key == QLatin1String("episodes_collected")) {
            stats.episodesCollected = value.toInt();
        } else if (key == QLatin1String("total_training_steps")) {
            stats.totalTrainingSteps = value.toLongLong();
        } else if (key == QLatin1String("average_reward")) {
            stats.averageReward = value.toDouble();
        } else if (key == QLatin1String("last_training_time_ms")) {
            bool ok = false;
            const qint64 ms = value.toLongLong(&ok);
            if (ok) {
                stats.lastTrainingTime = QDateTime::fromMSecsSinceEpoch(ms, Qt::UTC);
            }
        } else if (key == QLatin1String("last_policy_loss")) {
            stats.lastPolicyLoss = value.toDouble();
        } else if (key == QLatin1String("last_baseline_loss")) {
            stats.lastBaselineLoss = value.toDouble();
        }
    }
    sqlite3_finalize(stmt);

    if (rows == 0) {
        return std::nullopt;
    }
    return stats;
}

bool TrainingStore::saveEpisodeSummaries(const QVector<Episode>& episodes,
                                         const QString& batchId,
                                         QString* errorOut)
{
    if (episodes.isEmpty()) {
        return true;
    }

    static constexpr const char* kSql = R"(
        INSERT INTO episode_summaries (batch_id, episode_length, total_reward, timestamp, rewards_json)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";

    if (!execSql("BEGIN IMMEDIATE", errorOut)) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        if (errorOut) {
            *errorOut = QString::fromUtf8(sqlite3_errmsg(m_db));
        }
        rollback();
        return false;
    }

    const QByteArray batchUtf8 = batchId.toUtf8();
    bool ok = true;
    for (const Episode& episode : episodes) {
        const QDateTime stamp = episode.timestamp.isValid()
            ? episode.timestamp
            : QDateTime::currentDateTimeUtc();
        const QByteArray rewardsUtf8 = rewardsToJson(episode.rewards).toUtf8();

        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_text(stmt, 1, batchUtf8.constData(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, episode.length());
        sqlite3_bind_double(stmt, 3, episode.totalReward());
        sqlite3_bind_double(stmt, 4, static_cast<double>(stamp.toMSecsSinceEpoch()) / 1000.0);
        sqlite3_bind_text(stmt, 5, rewardsUtf8.constData(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            if (errorOut) {
                *errorOut = QString::fromUtf8(sqlite3_errmsg(m_db));
            }
            ok = false;
            break;
        }
    }
    sqlite3_finalize(stmt);

    if (!ok) {
        LOG_WARN(rtStore, "Failed to save episode summaries for batch %s", batchUtf8.constData());
        rollback();
        return false;
    }
    return execSql("COMMIT", errorOut);
}

QVector<EpisodeSummary> TrainingStore::episodeSummaries(int limit) const
{
    static constexpr const char* kSql = R"(
        SELECT id, batch_id, episode_length, total_reward, timestamp, rewards_json
        FROM episode_summaries
        ORDER BY id DESC
        LIMIT ?1
    )";

    QVector<EpisodeSummary> out;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return out;
    }
    sqlite3_bind_int(stmt, 1, std::max(limit, 0));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        EpisodeSummary summary;
        summary.id = sqlite3_column_int64(stmt, 0);
        summary.batchId = QString::fromUtf8(
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
        summary.episodeLength = sqlite3_column_int(stmt, 2);
        summary.totalReward = sqlite3_column_double(stmt, 3);
        summary.timestamp = QDateTime::fromMSecsSinceEpoch(
            qRound64(sqlite3_column_double(stmt, 4) * 1000.0), Qt::UTC);
        summary.rewards = rewardsFromJson(QString::fromUtf8(
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5))));
        out.push_back(summary);
    }
    sqlite3_finalize(stmt);
    return out;
}

int TrainingStore::episodeSummaryCount() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM episode_summaries", -1, &stmt, nullptr)
        != SQLITE_OK) {
        return 0;
    }
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace rt
