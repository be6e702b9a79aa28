#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rtCore)
Q_DECLARE_LOGGING_CATEGORY(rtState)
Q_DECLARE_LOGGING_CATEGORY(rtEnv)
Q_DECLARE_LOGGING_CATEGORY(rtAgent)
Q_DECLARE_LOGGING_CATEGORY(rtTraining)
Q_DECLARE_LOGGING_CATEGORY(rtStore)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
