/**
 * @file Resolver.h
 * @brief Free-text query to canonical media link
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/resolve/MetadataSearch.h"

#include <optional>

namespace MusicRelay {

/**
 * @brief Outcome of a successful resolution
 */
struct ResolvedSource {
    QString link;                ///< Canonical watch URL
    QString title;
    QStringList artists;
    ResultClass resultClass = ResultClass::Song;
};

/**
 * @class Resolver
 * @brief Two-pass first-result resolution (songs, then videos)
 *
 * No ranking: the first hit of the first pass that returns anything wins.
 * The search collaborator is borrowed and must outlive the resolver.
 */
class Resolver {
public:
    explicit Resolver(MetadataSearch& search);

    /**
     * @brief Resolve a free-text query
     * @return std::nullopt when neither pass yields a result
     */
    [[nodiscard]] std::optional<ResolvedSource> resolve(const QString& query);

    /**
     * @brief Canonical watch URL for a video id
     */
    [[nodiscard]] static QString watchUrl(const QString& videoId);

private:
    std::optional<ResolvedSource> firstHit(const QString& query, ResultClass cls);

    MetadataSearch& m_search;
};

} // namespace MusicRelay
