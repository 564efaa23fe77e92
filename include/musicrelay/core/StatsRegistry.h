/**
 * @file StatsRegistry.h
 * @brief Server-wide request and stream counters
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/core/Types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QMutex>

#include <atomic>
#include <optional>

namespace MusicRelay {

/**
 * @brief Point-in-time copy of the counters
 */
struct StatsSnapshot {
    qint64 totalRequests = 0;
    qint64 successfulStreams = 0;
    qint64 failedStreams = 0;
    qint64 cacheHits = 0;
    qint64 cacheMisses = 0;
    QDateTime startTime;
    std::optional<QDateTime> lastStreamTime;

    /**
     * @brief Cache hit percentage (0 when nothing was looked up yet)
     */
    [[nodiscard]] double hitRate() const noexcept {
        const qint64 lookups = cacheHits + cacheMisses;
        return lookups > 0 ? static_cast<double>(cacheHits) * 100.0 / static_cast<double>(lookups) : 0.0;
    }

    /**
     * @brief Successful stream percentage
     */
    [[nodiscard]] double successRate() const noexcept {
        const qint64 streams = successfulStreams + failedStreams;
        return streams > 0 ? static_cast<double>(successfulStreams) * 100.0 / static_cast<double>(streams) : 0.0;
    }

    [[nodiscard]] QJsonObject toJson() const;
};

/**
 * @class StatsRegistry
 * @brief Passive counters updated by the request handlers
 *
 * Counters are atomics; the last stream time is guarded by a mutex.
 * Nothing here influences request handling.
 */
class StatsRegistry {
public:
    StatsRegistry();

    StatsRegistry(const StatsRegistry&) = delete;
    StatsRegistry& operator=(const StatsRegistry&) = delete;

    void recordRequest() noexcept { m_totalRequests.fetch_add(1, std::memory_order_relaxed); }
    void recordCacheHit() noexcept { m_cacheHits.fetch_add(1, std::memory_order_relaxed); }
    void recordCacheMiss() noexcept { m_cacheMisses.fetch_add(1, std::memory_order_relaxed); }

    /**
     * @brief Record the outcome of a streaming request and stamp the time
     */
    void recordStream(bool success);

    [[nodiscard]] StatsSnapshot snapshot() const;

    [[nodiscard]] QDateTime startTime() const noexcept { return m_startTime; }

    /**
     * @brief Whole seconds since construction
     */
    [[nodiscard]] qint64 uptimeSeconds() const;

private:
    const QDateTime m_startTime;

    std::atomic<qint64> m_totalRequests{0};
    std::atomic<qint64> m_successfulStreams{0};
    std::atomic<qint64> m_failedStreams{0};
    std::atomic<qint64> m_cacheHits{0};
    std::atomic<qint64> m_cacheMisses{0};

    mutable QMutex m_mutex;
    std::optional<QDateTime> m_lastStreamTime;
};

/**
 * @brief Format a duration in seconds as "H:MM:SS" (days prefixed when > 0)
 */
[[nodiscard]] QString formatUptime(qint64 seconds);

} // namespace MusicRelay
