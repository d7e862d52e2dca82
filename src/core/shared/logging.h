#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rpCore)
Q_DECLARE_LOGGING_CATEGORY(rpStore)
Q_DECLARE_LOGGING_CATEGORY(rpTaste)
Q_DECLARE_LOGGING_CATEGORY(rpRetrieval)
Q_DECLARE_LOGGING_CATEGORY(rpRanking)
Q_DECLARE_LOGGING_CATEGORY(rpRun)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
