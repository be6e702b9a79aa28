#include "core/session/session_tracker.h"

#include "core/shared/logging.h"

#include <algorithm>

namespace rt {

void SessionTracker::startSession()
{
    m_startTime = QDateTime::currentDateTimeUtc();
    m_commands.clear();
    m_progress = 0.0;
    ++m_sessionCount;
    LOG_DEBUG(rtCore, "Tracking session %d", m_sessionCount);
}

void SessionTracker::endSession()
{
    m_startTime = QDateTime();
}

void SessionTracker::addCommand(const QString& command)
{
    m_commands.append(command);
    while (m_commands.size() > kMaxCommands) {
        m_commands.removeFirst();
    }
}

void SessionTracker::updateProgress(double progress)
{
    m_progress = kUnitRange.clamp(progress);
}

double SessionTracker::sessionDurationSeconds() const
{
    if (!m_startTime.isValid()) {
        return 0.0;
    }
    return std::max<qint64>(0, m_startTime.msecsTo(QDateTime::currentDateTimeUtc())) / 1000.0;
}

std::optional<QueryRecord> SessionTracker::createQueryRecord(const QueryRecord& observed,
                                                             const QueryOverrides& overrides,
                                                             ValidationError* errorOut) const
{
    QueryRecord record = observed;
    record.recentCommands = overrides.recentCommands.value_or(m_commands);
    record.sessionDuration = overrides.sessionDuration.value_or(sessionDurationSeconds());
    record.actionCount = overrides.actionCount.value_or(m_commands.size());

    if (!record.validate(errorOut)) {
        return std::nullopt;
    }
    return record;
}

} // namespace rt
