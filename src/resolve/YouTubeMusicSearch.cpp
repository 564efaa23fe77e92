/**
 * @file YouTubeMusicSearch.cpp
 * @brief Implementation of the InnerTube music search client
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/resolve/YouTubeMusicSearch.h"
#include "musicrelay/core/UserAgent.h"
#include "net/CurlWrapper.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUrlQuery>

namespace MusicRelay {

namespace {
    constexpr auto CLIENT_NAME = "WEB_REMIX";
    constexpr auto CLIENT_VERSION = "1.20240101.01.00";
    constexpr auto CLIENT_ID = "67";

    // Search filters as sent by the music.youtube.com web client
    constexpr auto PARAMS_SONGS = "EgWKAQIIAWoMEAMQBBAJEA4QChAF";
    constexpr auto PARAMS_VIDEOS = "EgWKAQIQAWoMEAMQBBAJEA4QChAF";

    constexpr auto ARTIST_PAGE_TYPE = "MUSIC_PAGE_TYPE_ARTIST";

    QJsonArray flexColumnRuns(const QJsonValue& item, int column)
    {
        return item[QLatin1String("flexColumns")][column]
                   [QLatin1String("musicResponsiveListItemFlexColumnRenderer")]
                   [QLatin1String("text")][QLatin1String("runs")].toArray();
    }

    QString extractVideoId(const QJsonValue& item)
    {
        QString id = item[QLatin1String("playlistItemData")][QLatin1String("videoId")].toString();
        if (!id.isEmpty()) return id;

        const QJsonArray titleRuns = flexColumnRuns(item, 0);
        if (!titleRuns.isEmpty()) {
            id = titleRuns.first()[QLatin1String("navigationEndpoint")]
                                  [QLatin1String("watchEndpoint")][QLatin1String("videoId")].toString();
            if (!id.isEmpty()) return id;
        }

        return item[QLatin1String("overlay")][QLatin1String("musicItemThumbnailOverlayRenderer")]
                   [QLatin1String("content")][QLatin1String("musicPlayButtonRenderer")]
                   [QLatin1String("playNavigationEndpoint")][QLatin1String("watchEndpoint")]
                   [QLatin1String("videoId")].toString();
    }

    QStringList extractArtists(const QJsonValue& item)
    {
        const QJsonArray runs = flexColumnRuns(item, 1);
        QStringList artists;

        for (const QJsonValue& run : runs) {
            const QString pageType = run[QLatin1String("navigationEndpoint")]
                [QLatin1String("browseEndpoint")][QLatin1String("browseEndpointContextSupportedConfigs")]
                [QLatin1String("browseEndpointContextMusicConfig")][QLatin1String("pageType")].toString();
            if (pageType == QLatin1String(ARTIST_PAGE_TYPE)) {
                artists << run[QLatin1String("text")].toString();
            }
        }

        // Uploaded videos carry the channel as plain text
        if (artists.isEmpty() && !runs.isEmpty()) {
            const QString first = runs.first()[QLatin1String("text")].toString().trimmed();
            if (!first.isEmpty()) {
                artists << first;
            }
        }
        return artists;
    }
}

YouTubeMusicSearch::YouTubeMusicSearch(QUrl endpoint, int timeoutSeconds)
    : m_endpoint(std::move(endpoint))
    , m_timeoutSeconds(timeoutSeconds)
{
}

QJsonObject YouTubeMusicSearch::buildRequest(const QString& query, ResultClass cls)
{
    QJsonObject client;
    client[QStringLiteral("clientName")] = QLatin1String(CLIENT_NAME);
    client[QStringLiteral("clientVersion")] = QLatin1String(CLIENT_VERSION);
    client[QStringLiteral("hl")] = QStringLiteral("en");
    client[QStringLiteral("gl")] = QStringLiteral("US");

    QJsonObject request;
    request[QStringLiteral("context")] = QJsonObject{{QStringLiteral("client"), client}};
    request[QStringLiteral("query")] = query;
    request[QStringLiteral("params")] = QLatin1String(cls == ResultClass::Song ? PARAMS_SONGS
                                                                               : PARAMS_VIDEOS);
    return request;
}

QList<SearchHit> YouTubeMusicSearch::parseResponse(const QJsonObject& response)
{
    QList<SearchHit> hits;

    const QJsonValue root(response);
    const QJsonArray sections = root[QLatin1String("contents")]
        [QLatin1String("tabbedSearchResultsRenderer")][QLatin1String("tabs")][0]
        [QLatin1String("tabRenderer")][QLatin1String("content")]
        [QLatin1String("sectionListRenderer")][QLatin1String("contents")].toArray();

    for (const QJsonValue& section : sections) {
        const QJsonArray rows = section[QLatin1String("musicShelfRenderer")]
                                       [QLatin1String("contents")].toArray();

        for (const QJsonValue& row : rows) {
            const QJsonValue item = row[QLatin1String("musicResponsiveListItemRenderer")];
            if (!item.isObject()) continue;

            SearchHit hit;
            hit.videoId = extractVideoId(item);
            if (hit.videoId.isEmpty()) continue;

            const QJsonArray titleRuns = flexColumnRuns(item, 0);
            if (!titleRuns.isEmpty()) {
                hit.title = titleRuns.first()[QLatin1String("text")].toString();
            }
            hit.artists = extractArtists(item);
            hits.append(hit);
        }
    }

    return hits;
}

std::optional<QList<SearchHit>> YouTubeMusicSearch::search(const QString& query, ResultClass cls)
{
    QUrl url(m_endpoint);
    QUrlQuery urlQuery(url);
    urlQuery.addQueryItem(QStringLiteral("prettyPrint"), QStringLiteral("false"));
    url.setQuery(urlQuery);

    CurlEasyHandle handle;
    if (!handle.isValid()) {
        return std::nullopt;
    }

    handle.setUrl(url);
    handle.setTimeout(m_timeoutSeconds);
    handle.setUserAgent(randomUserAgent());
    handle.addHeader(QStringLiteral("Content-Type: application/json"));
    handle.addHeader(QStringLiteral("Accept: application/json"));
    handle.addHeader(QStringLiteral("Origin: https://music.youtube.com"));
    handle.addHeader(QStringLiteral("X-Youtube-Client-Name: %1").arg(QLatin1String(CLIENT_ID)));
    handle.addHeader(QStringLiteral("X-Youtube-Client-Version: %1").arg(QLatin1String(CLIENT_VERSION)));
    handle.setReferer(QStringLiteral("https://music.youtube.com/"));

    const QByteArray body = QJsonDocument(buildRequest(query, cls)).toJson(QJsonDocument::Compact);
    const CurlResult result = handle.performPost(body);

    if (!result.success()) {
        qWarning() << "YouTubeMusicSearch: Search failed for" << query
                   << "(" << resultClassToString(cls) << "):"
                   << (result.transportOk() ? QStringLiteral("HTTP %1").arg(result.httpCode)
                                            : result.errorMessage);
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(handle.responseBody(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "YouTubeMusicSearch: JSON parse error:" << parseError.errorString();
        return std::nullopt;
    }

    QList<SearchHit> hits = parseResponse(doc.object());
    qDebug() << "YouTubeMusicSearch:" << hits.size() << resultClassToString(cls) << "for" << query;
    return hits;
}

} // namespace MusicRelay
