#pragma once

#include "core/shared/query_record.h"

#include <QDateTime>
#include <QStringList>

#include <optional>

namespace rt {

// Fields createQueryRecord() takes from the tracker unless given here.
struct QueryOverrides {
    std::optional<QStringList> recentCommands;
    std::optional<double> sessionDuration;
    std::optional<int> actionCount;
};

// Tracks the listener's current session: recent commands, progress and
// elapsed time.
class SessionTracker {
public:
    static constexpr int kMaxCommands = 10;

    void startSession();
    void endSession();
    bool isActive() const { return m_startTime.isValid(); }

    void addCommand(const QString& command);
    QStringList commandHistory() const { return m_commands; }

    void updateProgress(double progress);
    double progress() const { return m_progress; }

    double sessionDurationSeconds() const;
    int sessionCount() const { return m_sessionCount; }

    // Completes observed with tracker data and validates the result.
    std::optional<QueryRecord> createQueryRecord(const QueryRecord& observed,
                                                 const QueryOverrides& overrides = QueryOverrides(),
                                                 ValidationError* errorOut = nullptr) const;

private:
    QDateTime m_startTime;
    QStringList m_commands;
    double m_progress = 0.0;
    int m_sessionCount = 0;
};

} // namespace rt
