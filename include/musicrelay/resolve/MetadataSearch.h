/**
 * @file MetadataSearch.h
 * @brief Interface to an external music metadata search service
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

namespace MusicRelay {

/**
 * @brief Result class a search is restricted to
 */
enum class ResultClass : uint8_t {
    Song,
    Video
};

inline QString resultClassToString(ResultClass cls) {
    return cls == ResultClass::Song ? QStringLiteral("songs") : QStringLiteral("videos");
}

/**
 * @brief One search result row
 */
struct SearchHit {
    QString videoId;             ///< Service identifier of the item
    QString title;
    QStringList artists;
};

/**
 * @brief Abstract metadata search collaborator
 *
 * Implementations are called concurrently from request workers and must be
 * thread-safe.
 */
class MetadataSearch {
public:
    virtual ~MetadataSearch() = default;

    /**
     * @brief Search within one result class
     * @return Results in service order, or std::nullopt on transport/parse failure
     */
    [[nodiscard]] virtual std::optional<QList<SearchHit>> search(const QString& query,
                                                                 ResultClass cls) = 0;
};

} // namespace MusicRelay
