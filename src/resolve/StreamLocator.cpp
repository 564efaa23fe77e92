/**
 * @file StreamLocator.cpp
 * @brief Implementation of cached stream location
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/resolve/StreamLocator.h"
#include "musicrelay/cache/StreamCache.h"
#include "musicrelay/core/StatsRegistry.h"
#include "musicrelay/resolve/ExtractorChain.h"
#include "musicrelay/resolve/Resolver.h"

#include <QDebug>
#include <QMutexLocker>

#include <memory>

namespace MusicRelay {

StreamLocator::StreamLocator(StreamCache& cache, Resolver& resolver, ExtractorChain& chain,
                             StatsRegistry& stats, bool singleFlight)
    : m_cache(cache)
    , m_resolver(resolver)
    , m_chain(chain)
    , m_stats(stats)
    , m_singleFlight(singleFlight)
{
}

Resolution StreamLocator::locate(const QString& query)
{
    const std::optional<ResolutionRequest> request = QueryNormalizer::normalize(query);
    if (!request) {
        return Resolution::failure(ErrorKind::EmptyQuery, QStringLiteral("Empty query"));
    }

    m_cache.sweep();
    m_cache.enforceCapacity();

    if (std::optional<QString> cached = m_cache.lookup(request->key)) {
        qInfo() << "StreamLocator: Cache hit for" << request->original;
        m_stats.recordCacheHit();

        Resolution resolution;
        resolution.request = request;
        resolution.audioUrl = *cached;
        resolution.fromCache = true;
        return resolution;
    }

    m_stats.recordCacheMiss();
    qInfo() << "StreamLocator: Processing query" << request->original;

    Resolution resolution = m_singleFlight ? joinOrResolve(*request) : resolveUncached(*request);
    resolution.request = request;
    return resolution;
}

Resolution StreamLocator::joinOrResolve(const ResolutionRequest& request)
{
    std::shared_ptr<std::promise<Resolution>> promise;
    std::shared_future<Resolution> flight;

    {
        QMutexLocker locker(&m_flightMutex);

        auto it = m_inFlight.find(request.key);
        if (it != m_inFlight.end()) {
            flight = it->second;
        } else {
            // A flight may have landed between the cache lookup and here
            if (std::optional<QString> cached = m_cache.lookup(request.key)) {
                Resolution resolution;
                resolution.audioUrl = *cached;
                resolution.fromCache = true;
                return resolution;
            }

            promise = std::make_shared<std::promise<Resolution>>();
            flight = promise->get_future().share();
            m_inFlight.emplace(request.key, flight);
        }
    }

    if (!promise) {
        qDebug() << "StreamLocator: Joining in-flight resolution for" << request.key;
        Resolution shared = flight.get();
        shared.sharedFlight = true;
        return shared;
    }

    try {
        Resolution resolution = resolveUncached(request);
        {
            QMutexLocker locker(&m_flightMutex);
            m_inFlight.erase(request.key);
        }
        promise->set_value(resolution);
        return resolution;
    } catch (...) {
        {
            QMutexLocker locker(&m_flightMutex);
            m_inFlight.erase(request.key);
        }
        promise->set_exception(std::current_exception());
        throw;
    }
}

Resolution StreamLocator::resolveUncached(const ResolutionRequest& request)
{
    Resolution resolution;
    QString link = request.original;

    if (!request.isDirectLink) {
        std::optional<ResolvedSource> source = m_resolver.resolve(request.original);
        if (!source) {
            qWarning() << "StreamLocator: Song not found:" << request.original;
            return Resolution::failure(ErrorKind::NotFound,
                                       QStringLiteral("No search result for %1").arg(request.original));
        }
        link = source->link;
        resolution.title = source->title;
        resolution.artists = source->artists;
    }

    ExtractionResult extraction = m_chain.extract(link);
    if (!extraction.ok()) {
        qWarning() << "StreamLocator: Could not get audio URL for" << request.original;
        Resolution failed = Resolution::failure(ErrorKind::ExtractionFailed,
                                                extraction.attempts.join(QStringLiteral("; ")));
        failed.title = resolution.title;
        failed.artists = resolution.artists;
        return failed;
    }

    resolution.audioUrl = *extraction.audioUrl;
    m_cache.insert(request.key, resolution.audioUrl);
    qInfo() << "StreamLocator: Cached" << request.key << "via" << extraction.source;
    return resolution;
}

} // namespace MusicRelay
