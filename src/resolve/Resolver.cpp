/**
 * @file Resolver.cpp
 * @brief Implementation of query resolution
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/resolve/Resolver.h"

#include <QDebug>

namespace MusicRelay {

Resolver::Resolver(MetadataSearch& search)
    : m_search(search)
{
}

QString Resolver::watchUrl(const QString& videoId)
{
    return QStringLiteral("https://www.youtube.com/watch?v=") + videoId;
}

std::optional<ResolvedSource> Resolver::resolve(const QString& query)
{
    if (auto source = firstHit(query, ResultClass::Song)) {
        return source;
    }
    if (auto source = firstHit(query, ResultClass::Video)) {
        return source;
    }

    qWarning() << "Resolver: No result for" << query;
    return std::nullopt;
}

std::optional<ResolvedSource> Resolver::firstHit(const QString& query, ResultClass cls)
{
    // Transport failure counts as an empty pass
    const std::optional<QList<SearchHit>> hits = m_search.search(query, cls);
    if (!hits || hits->isEmpty()) {
        return std::nullopt;
    }

    const SearchHit& hit = hits->first();

    ResolvedSource source;
    source.link = watchUrl(hit.videoId);
    source.title = hit.title;
    source.artists = hit.artists;
    source.resultClass = cls;

    qInfo() << "Resolver: Found" << resultClassToString(cls) << "result:" << hit.title
            << "-" << hit.artists.join(QStringLiteral(", "));
    return source;
}

} // namespace MusicRelay
