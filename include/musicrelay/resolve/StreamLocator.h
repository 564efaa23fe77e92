/**
 * @file StreamLocator.h
 * @brief Query to playable audio URL, through the cache
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/core/Types.h"
#include "musicrelay/resolve/QueryNormalizer.h"

#include <QMutex>
#include <QStringList>

#include <future>
#include <map>
#include <optional>

namespace MusicRelay {

class StreamCache;
class Resolver;
class ExtractorChain;
class StatsRegistry;

/**
 * @brief Outcome of locating a query
 */
struct Resolution {
    std::optional<ResolutionRequest> request;
    QString audioUrl;
    ErrorKind error = ErrorKind::None;
    bool fromCache = false;
    bool sharedFlight = false;   ///< Result of another request's in-flight resolution
    QString title;               ///< Search result title, when a search ran
    QStringList artists;
    QString detail;              ///< Failure description for logs

    [[nodiscard]] bool ok() const noexcept { return error == ErrorKind::None && !audioUrl.isEmpty(); }

    [[nodiscard]] static Resolution failure(ErrorKind kind, QString why = QString()) {
        Resolution r;
        r.error = kind;
        r.detail = std::move(why);
        return r;
    }
};

/**
 * @class StreamLocator
 * @brief normalize → sweep/evict → cache lookup → search → extract → insert
 *
 * With single-flight enabled, concurrent misses on the same key wait for the
 * first request's resolution instead of starting their own.
 *
 * All collaborators are borrowed and must outlive the locator.
 */
class StreamLocator {
public:
    StreamLocator(StreamCache& cache, Resolver& resolver, ExtractorChain& chain,
                  StatsRegistry& stats, bool singleFlight = true);

    StreamLocator(const StreamLocator&) = delete;
    StreamLocator& operator=(const StreamLocator&) = delete;

    /**
     * @brief Locate a playable URL for a raw query. Thread-safe.
     */
    [[nodiscard]] Resolution locate(const QString& query);

    [[nodiscard]] bool singleFlight() const noexcept { return m_singleFlight; }

private:
    Resolution resolveUncached(const ResolutionRequest& request);
    Resolution joinOrResolve(const ResolutionRequest& request);

    StreamCache& m_cache;
    Resolver& m_resolver;
    ExtractorChain& m_chain;
    StatsRegistry& m_stats;
    const bool m_singleFlight;

    QMutex m_flightMutex;
    std::map<QString, std::shared_future<Resolution>> m_inFlight;
};

} // namespace MusicRelay
