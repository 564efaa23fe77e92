/**
 * @file StatsRegistry.cpp
 * @brief Implementation of server statistics
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/core/StatsRegistry.h"

#include <QMutexLocker>

namespace MusicRelay {

QJsonObject StatsSnapshot::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("start_time")] = startTime.toString(Qt::ISODate);
    obj[QStringLiteral("total_requests")] = totalRequests;
    obj[QStringLiteral("successful_streams")] = successfulStreams;
    obj[QStringLiteral("failed_streams")] = failedStreams;
    obj[QStringLiteral("cache_hits")] = cacheHits;
    obj[QStringLiteral("cache_misses")] = cacheMisses;
    obj[QStringLiteral("last_stream_time")] = lastStreamTime
        ? QJsonValue(lastStreamTime->toString(Qt::ISODate))
        : QJsonValue(QJsonValue::Null);
    return obj;
}

StatsRegistry::StatsRegistry()
    : m_startTime(QDateTime::currentDateTime())
{
}

void StatsRegistry::recordStream(bool success)
{
    if (success) {
        m_successfulStreams.fetch_add(1, std::memory_order_relaxed);
    } else {
        m_failedStreams.fetch_add(1, std::memory_order_relaxed);
    }

    QMutexLocker locker(&m_mutex);
    m_lastStreamTime = QDateTime::currentDateTime();
}

StatsSnapshot StatsRegistry::snapshot() const
{
    StatsSnapshot snap;
    snap.startTime = m_startTime;
    snap.totalRequests = m_totalRequests.load(std::memory_order_relaxed);
    snap.successfulStreams = m_successfulStreams.load(std::memory_order_relaxed);
    snap.failedStreams = m_failedStreams.load(std::memory_order_relaxed);
    snap.cacheHits = m_cacheHits.load(std::memory_order_relaxed);
    snap.cacheMisses = m_cacheMisses.load(std::memory_order_relaxed);

    QMutexLocker locker(&m_mutex);
    snap.lastStreamTime = m_lastStreamTime;
    return snap;
}

qint64 StatsRegistry::uptimeSeconds() const
{
    return m_startTime.secsTo(QDateTime::currentDateTime());
}

QString formatUptime(qint64 seconds)
{
    if (seconds < 0) seconds = 0;

    const qint64 days = seconds / 86400;
    const qint64 hours = (seconds % 86400) / 3600;
    const qint64 minutes = (seconds % 3600) / 60;
    const qint64 secs = seconds % 60;

    QString hms = QStringLiteral("%1:%2:%3")
        .arg(hours)
        .arg(minutes, 2, 10, QLatin1Char('0'))
        .arg(secs, 2, 10, QLatin1Char('0'));

    if (days > 0) {
        return QStringLiteral("%1 day%2, %3").arg(days)
            .arg(days == 1 ? QString() : QStringLiteral("s"))
            .arg(hms);
    }
    return hms;
}

} // namespace MusicRelay
