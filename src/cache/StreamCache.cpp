/**
 * @file StreamCache.cpp
 * @brief Implementation of the resolved-URL cache
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/cache/StreamCache.h"

#include <QDebug>
#include <QMutexLocker>

#include <algorithm>
#include <vector>

namespace MusicRelay {

StreamCache::StreamCache(std::chrono::seconds ttl, int capacity, Clock clock)
    : m_ttl(ttl)
    , m_capacity(capacity)
    , m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
}

std::optional<QString> StreamCache::lookup(const QString& key)
{
    QMutexLocker locker(&m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }

    if (isExpired(it.value(), m_clock())) {
        m_entries.erase(it);
        qDebug() << "StreamCache: Dropped stale entry" << key;
        return std::nullopt;
    }

    return it.value().resolvedUrl;
}

void StreamCache::insert(const QString& key, const QString& resolvedUrl)
{
    QMutexLocker locker(&m_mutex);
    m_entries.insert(key, CacheEntry{key, resolvedUrl, m_clock()});
    qDebug() << "StreamCache: Stored" << key;
}

int StreamCache::sweep()
{
    QMutexLocker locker(&m_mutex);

    const Timestamp now = m_clock();
    int removed = 0;

    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (isExpired(it.value(), now)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        qInfo() << "StreamCache: Swept" << removed << "expired entries";
    }
    return removed;
}

int StreamCache::enforceCapacity()
{
    QMutexLocker locker(&m_mutex);

    const int excess = static_cast<int>(m_entries.size()) - m_capacity;
    if (excess <= 0) {
        return 0;
    }

    std::vector<std::pair<Timestamp, QString>> byAge;
    byAge.reserve(static_cast<size_t>(m_entries.size()));
    for (auto it = m_entries.cbegin(); it != m_entries.cend(); ++it) {
        byAge.emplace_back(it.value().createdAt, it.key());
    }
    std::sort(byAge.begin(), byAge.end());

    for (int i = 0; i < excess; ++i) {
        m_entries.remove(byAge[static_cast<size_t>(i)].second);
    }

    qInfo() << "StreamCache: Evicted" << excess << "oldest entries";
    return excess;
}

int StreamCache::clear()
{
    QMutexLocker locker(&m_mutex);
    const int count = static_cast<int>(m_entries.size());
    m_entries.clear();
    return count;
}

int StreamCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_entries.size());
}

} // namespace MusicRelay
