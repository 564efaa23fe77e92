/**
 * @file YouTubeMusicSearch.h
 * @brief YouTube Music InnerTube search client
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/resolve/MetadataSearch.h"

#include <QJsonObject>
#include <QUrl>

namespace MusicRelay {

/**
 * @class YouTubeMusicSearch
 * @brief Searches music.youtube.com through the WEB_REMIX InnerTube API
 *
 * Each call performs one blocking POST on the calling thread.
 */
class YouTubeMusicSearch : public MetadataSearch {
public:
    explicit YouTubeMusicSearch(QUrl endpoint, int timeoutSeconds);

    [[nodiscard]] std::optional<QList<SearchHit>> search(const QString& query,
                                                         ResultClass cls) override;

    /**
     * @brief Build the InnerTube request body for a query
     */
    [[nodiscard]] static QJsonObject buildRequest(const QString& query, ResultClass cls);

    /**
     * @brief Extract result rows from an InnerTube search response
     *
     * Rows without a video id are skipped.
     */
    [[nodiscard]] static QList<SearchHit> parseResponse(const QJsonObject& response);

private:
    QUrl m_endpoint;
    int m_timeoutSeconds;
};

} // namespace MusicRelay
