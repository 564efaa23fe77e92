/**
 * @file StreamCache.h
 * @brief Bounded TTL cache of resolved audio URLs
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/core/Types.h"

#include <QHash>
#include <QMutex>
#include <QString>

#include <functional>
#include <optional>

namespace MusicRelay {

/**
 * @brief One cached resolution
 */
struct CacheEntry {
    QString key;
    QString resolvedUrl;
    Timestamp createdAt;
};

/**
 * @class StreamCache
 * @brief Maps normalized query keys to resolved URLs
 *
 * An entry is expired once now - createdAt >= TTL, whether or not it has
 * been swept yet. Capacity is only enforced by enforceCapacity(), which
 * evicts the oldest-created entries first.
 *
 * Every operation runs under a single mutex.
 */
class StreamCache {
public:
    using Clock = std::function<Timestamp()>;

    StreamCache(std::chrono::seconds ttl, int capacity, Clock clock = {});

    StreamCache(const StreamCache&) = delete;
    StreamCache& operator=(const StreamCache&) = delete;

    /**
     * @brief Fetch a live entry; an expired one is removed and reported absent
     */
    [[nodiscard]] std::optional<QString> lookup(const QString& key);

    /**
     * @brief Insert or overwrite, stamping the current time
     */
    void insert(const QString& key, const QString& resolvedUrl);

    /**
     * @brief Remove all expired entries
     * @return Number removed
     */
    int sweep();

    /**
     * @brief Evict oldest-created entries until size() <= capacity()
     * @return Number evicted
     */
    int enforceCapacity();

    /**
     * @brief Remove everything
     * @return Number of entries held before the call
     */
    int clear();

    [[nodiscard]] int size() const;

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return m_ttl; }
    [[nodiscard]] int capacity() const noexcept { return m_capacity; }

private:
    [[nodiscard]] bool isExpired(const CacheEntry& entry, Timestamp now) const {
        return now - entry.createdAt >= m_ttl;
    }

    const std::chrono::seconds m_ttl;
    const int m_capacity;
    Clock m_clock;

    mutable QMutex m_mutex;
    QHash<QString, CacheEntry> m_entries;
};

} // namespace MusicRelay
