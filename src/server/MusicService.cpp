/**
 * @file MusicService.cpp
 * @brief Implementation of the HTTP endpoints
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/server/MusicService.h"
#include "musicrelay/cache/StreamCache.h"
#include "musicrelay/core/CancellationToken.h"
#include "musicrelay/core/StatsRegistry.h"
#include "musicrelay/resolve/ExtractionBackend.h"
#include "musicrelay/resolve/QueryNormalizer.h"
#include "musicrelay/resolve/StreamLocator.h"
#include "musicrelay/stream/OutputProfile.h"
#include "musicrelay/stream/TranscodeEngine.h"

#include <QDateTime>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUrl>

#include <exception>

namespace MusicRelay {

namespace {
    constexpr int MAX_FILENAME_LENGTH = 100;

    const QByteArray CONTENT_TYPE = QByteArrayLiteral("Content-Type");
    const QByteArray AUDIO_MPEG = QByteArrayLiteral("audio/mpeg");
    const QByteArray NO_CACHE = QByteArrayLiteral("no-cache, no-store, must-revalidate");

    // RFC 3986 unreserved characters and '/' stay literal
    QString quote(const QString& value)
    {
        return QString::fromLatin1(QUrl::toPercentEncoding(value, QByteArrayLiteral("/")));
    }

    qint64 unixTime()
    {
        return QDateTime::currentSecsSinceEpoch();
    }

    QJsonObject endpoint(const char* path, const char* description)
    {
        return QJsonObject{
            {QStringLiteral("method"), QStringLiteral("GET")},
            {QStringLiteral("path"), QString::fromUtf8(path)},
            {QStringLiteral("description"), QString::fromUtf8(description)},
        };
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Construction and Dispatch
// ═══════════════════════════════════════════════════════════════════════════════

MusicService::MusicService(StreamLocator& locator, ExtractionBackend& infoBackend, TranscodeEngine& engine,
                           StreamCache& cache, StatsRegistry& stats, ToolStatus tools)
    : m_locator(locator)
    , m_infoBackend(infoBackend)
    , m_engine(engine)
    , m_cache(cache)
    , m_stats(stats)
    , m_tools(std::move(tools))
{
    auto bind = [this](void (MusicService::*method)(const HttpRequest&, HttpResponder&)) {
        return [this, method](const HttpRequest& request, HttpResponder& responder) {
            (this->*method)(request, responder);
        };
    };

    m_routes.insert(QStringLiteral("/stream"), bind(&MusicService::handleStream));
    m_routes.insert(QStringLiteral("/esp32_stream"), bind(&MusicService::handleEsp32Stream));
    m_routes.insert(QStringLiteral("/stream_pcm"), bind(&MusicService::handleStreamPcm));
    m_routes.insert(QStringLiteral("/api/music"), bind(&MusicService::handleApiMusic));
    m_routes.insert(QStringLiteral("/download"), bind(&MusicService::handleDownload));
    m_routes.insert(QStringLiteral("/clear_cache"), bind(&MusicService::handleClearCache));
    m_routes.insert(QStringLiteral("/status"), bind(&MusicService::handleStatus));
    m_routes.insert(QStringLiteral("/stats"), bind(&MusicService::handleStats));
    m_routes.insert(QStringLiteral("/debug"), bind(&MusicService::handleDebug));
}

void MusicService::handle(const HttpRequest& request, HttpResponder& responder)
{
    m_stats.recordRequest();

    const auto route = m_routes.constFind(request.path);
    if (route == m_routes.constEnd()) {
        sendJson(responder, 404, QJsonObject{
            {QStringLiteral("error"), QStringLiteral("Not Found")},
            {QStringLiteral("message"), QStringLiteral("Endpoint không tồn tại")},
            {QStringLiteral("path"), request.path},
        });
        return;
    }

    if (request.method != "GET") {
        sendJson(responder, 405, QJsonObject{
            {QStringLiteral("error"), QStringLiteral("Method Not Allowed")},
            {QStringLiteral("message"), QStringLiteral("Only GET is supported")},
            {QStringLiteral("path"), request.path},
        });
        return;
    }

    try {
        route.value()(request, responder);
    } catch (const std::exception& e) {
        qCritical() << "MusicService: Internal error on" << request.path << ":" << e.what();
        sendInternalError(responder);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Streaming Endpoints
// ═══════════════════════════════════════════════════════════════════════════════

void MusicService::handleStream(const HttpRequest& request, HttpResponder& responder)
{
    const QString query = request.param(QStringLiteral("q"));
    if (query.isEmpty()) {
        sendText(responder, 400, QStringLiteral("❌ Thiếu tên bài hát. Sử dụng: /stream?q=tên_bài_hát"));
        return;
    }

    qInfo() << "MusicService: Stream request:" << query;

    const Resolution resolution = m_locator.locate(query);
    if (!resolution.ok()) {
        qWarning() << "MusicService: Could not get stream for" << query
                   << "(" << errorKindToString(resolution.error) << ")";
        m_stats.recordStream(false);
        sendText(responder, 404, QStringLiteral("❌ Không tìm thấy bài hát: %1").arg(query));
        return;
    }

    m_stats.recordStream(true);

    const HttpHeaders headers = {
        {CONTENT_TYPE, AUDIO_MPEG},
        {QByteArrayLiteral("Cache-Control"), NO_CACHE},
        {QByteArrayLiteral("Pragma"), QByteArrayLiteral("no-cache")},
        {QByteArrayLiteral("Expires"), QByteArrayLiteral("0")},
        {QByteArrayLiteral("Content-Disposition"),
         QStringLiteral("inline; filename=\"%1.mp3\"").arg(quote(query)).toUtf8()},
    };
    streamTranscoded(responder, resolution.audioUrl, OutputProfile::web(), headers);
}

void MusicService::handleEsp32Stream(const HttpRequest& request, HttpResponder& responder)
{
    const QString song = request.param(QStringLiteral("song"));
    const QString singer = request.param(QStringLiteral("singer"));

    if (song.isEmpty()) {
        sendText(responder, 400, QStringLiteral("❌ Missing song parameter"));
        return;
    }

    const QString query = QueryNormalizer::composeQuery(song, singer);
    qInfo() << "MusicService: Device stream request:" << query;

    const Resolution resolution = m_locator.locate(query);
    if (!resolution.ok()) {
        qWarning() << "MusicService: Song not found:" << query;
        m_stats.recordStream(false);
        sendText(responder, 404, QStringLiteral("❌ Song not found"));
        return;
    }

    m_stats.recordStream(true);

    const HttpHeaders headers = {
        {CONTENT_TYPE, AUDIO_MPEG},
        {QByteArrayLiteral("Cache-Control"), NO_CACHE},
        {QByteArrayLiteral("Pragma"), QByteArrayLiteral("no-cache")},
        {QByteArrayLiteral("X-Content-Type-Options"), QByteArrayLiteral("nosniff")},
    };
    streamTranscoded(responder, resolution.audioUrl, OutputProfile::constrained(), headers);
}

void MusicService::handleDownload(const HttpRequest& request, HttpResponder& responder)
{
    const QString query = request.param(QStringLiteral("q"));
    if (query.isEmpty()) {
        sendText(responder, 400, QStringLiteral("❌ Thiếu tên bài hát"));
        return;
    }

    qInfo() << "MusicService: Download request:" << query;

    const Resolution resolution = m_locator.locate(query);
    if (!resolution.ok()) {
        sendText(responder, 404, QStringLiteral("❌ Không tìm thấy bài hát"));
        return;
    }

    const QString filename = downloadFilename(m_infoBackend.fetchInfo(resolution.audioUrl));

    const HttpHeaders headers = {
        {CONTENT_TYPE, AUDIO_MPEG},
        {QByteArrayLiteral("Cache-Control"), QByteArrayLiteral("no-cache, no-store")},
        {QByteArrayLiteral("Content-Disposition"),
         QStringLiteral("attachment; filename=\"%1.mp3\"").arg(filename).toUtf8()},
    };
    streamTranscoded(responder, resolution.audioUrl, OutputProfile::download(), headers);
}

void MusicService::streamTranscoded(HttpResponder& responder, const QString& audioUrl,
                                    const OutputProfile& profile, const HttpHeaders& headers)
{
    responder.sendStream(200, headers, [this, audioUrl, profile](ChunkWriter& writer) {
        CancellationToken token;
        const StreamOutcome outcome = m_engine.stream(
            audioUrl, profile,
            [&writer](const QByteArray& chunk) { return writer.write(chunk); },
            token,
            [&writer]() { return writer.isConnected(); });

        // The body ends truncated, or empty if nothing came out
        if (outcome.state == StreamState::SubprocessError) {
            qWarning() << "MusicService: Transcoder failed after" << formatByteSize(outcome.bytesSent)
                       << "(" << streamStateToString(outcome.state) << "/" << errorKindToString(outcome.error) << ")";
        }
    });
}

// ═══════════════════════════════════════════════════════════════════════════════
// JSON Endpoints
// ═══════════════════════════════════════════════════════════════════════════════

void MusicService::handleStreamPcm(const HttpRequest& request, HttpResponder& responder)
{
    const QString song = request.param(QStringLiteral("song"));
    const QString singer = request.param(QStringLiteral("singer"));

    if (song.isEmpty()) {
        sendJson(responder, 400, QJsonObject{
            {QStringLiteral("error"), QStringLiteral("Thiếu tham số song")},
            {QStringLiteral("artist"), QString()},
            {QStringLiteral("title"), QString()},
            {QStringLiteral("audio_url"), QString()},
            {QStringLiteral("lyric_url"), QString()},
        });
        return;
    }

    const QString query = QueryNormalizer::composeQuery(song, singer);
    qInfo() << "MusicService: Device JSON request: song=" << song << "singer=" << singer;

    const Resolution resolution = m_locator.locate(query);
    if (!resolution.ok()) {
        qWarning() << "MusicService: Song not found:" << query;
        m_stats.recordStream(false);
        sendJson(responder, 404, QJsonObject{
            {QStringLiteral("error"), QStringLiteral("Không tìm thấy bài hát: %1").arg(query)},
            {QStringLiteral("artist"), singer},
            {QStringLiteral("title"), song},
            {QStringLiteral("audio_url"), QString()},
            {QStringLiteral("lyric_url"), QString()},
        });
        return;
    }

    m_stats.recordStream(true);

    const MediaInfo info = m_infoBackend.fetchInfo(resolution.audioUrl);
    const QString title = info.title;
    const QString artist = (!singer.isEmpty() && !info.hasKnownArtist()) ? singer : info.artist;

    const QString streamUrl = QStringLiteral("http://%1/esp32_stream?song=%2&singer=%3")
        .arg(request.host(), quote(song), quote(singer));

    qInfo() << "MusicService: Device JSON response: title=" << title << "artist=" << artist;

    sendJson(responder, 200, QJsonObject{
        {QStringLiteral("artist"), artist},
        {QStringLiteral("title"), title},
        {QStringLiteral("audio_url"), streamUrl},
        {QStringLiteral("lyric_url"), QString()},
        {QStringLiteral("error"), QString()},
        {QStringLiteral("bitrate"), 128},
        {QStringLiteral("sample_rate"), 44100},
        {QStringLiteral("channels"), 2},
    });
}

void MusicService::handleApiMusic(const HttpRequest& request, HttpResponder& responder)
{
    const QString query = request.param(QStringLiteral("q"));
    if (query.isEmpty()) {
        sendJson(responder, 400, QJsonObject{
            {QStringLiteral("success"), false},
            {QStringLiteral("error"), QStringLiteral("Thiếu tên bài hát")},
            {QStringLiteral("code"), 400},
        });
        return;
    }

    qInfo() << "MusicService: API request:" << query;

    const Resolution resolution = m_locator.locate(query);
    if (!resolution.ok()) {
        sendJson(responder, 404, QJsonObject{
            {QStringLiteral("success"), false},
            {QStringLiteral("error"), QStringLiteral("Không tìm thấy bài hát: %1").arg(query)},
            {QStringLiteral("code"), 404},
        });
        return;
    }

    const MediaInfo info = m_infoBackend.fetchInfo(resolution.audioUrl);
    const QString quoted = quote(query);

    QJsonObject data;
    data[QStringLiteral("query")] = query;
    data[QStringLiteral("title")] = info.title;
    data[QStringLiteral("artist")] = info.artist;
    data[QStringLiteral("duration")] = info.duration;
    data[QStringLiteral("thumbnail")] = info.thumbnail;
    data[QStringLiteral("description")] = info.description;
    data[QStringLiteral("audio_url")] = resolution.audioUrl;
    data[QStringLiteral("stream_url")] = QStringLiteral("/stream?q=") + quoted;
    data[QStringLiteral("download_url")] = QStringLiteral("/download?q=") + quoted;
    data[QStringLiteral("api_url")] = QStringLiteral("/api/music?q=") + quoted;

    sendJson(responder, 200, QJsonObject{
        {QStringLiteral("success"), true},
        {QStringLiteral("data"), data},
        {QStringLiteral("timestamp"), unixTime()},
    });
}

void MusicService::handleClearCache(const HttpRequest& /*request*/, HttpResponder& responder)
{
    const int count = m_cache.clear();
    qInfo() << "MusicService: Cleared cache (" << count << "entries)";

    sendJson(responder, 200, QJsonObject{
        {QStringLiteral("success"), true},
        {QStringLiteral("message"), QStringLiteral("Đã xóa %1 mục cache").arg(count)},
        {QStringLiteral("cache_size"), 0},
        {QStringLiteral("timestamp"), unixTime()},
    });
}

void MusicService::handleStatus(const HttpRequest& /*request*/, HttpResponder& responder)
{
    m_cache.sweep();

    const qint64 uptime = m_stats.uptimeSeconds();

    QJsonObject tools;
    tools[QStringLiteral("ffmpeg")] = m_tools.ffmpegVersion.isEmpty()
        ? QJsonValue(QJsonValue::Null) : QJsonValue(m_tools.ffmpegVersion);
    tools[QStringLiteral("yt_dlp")] = m_tools.ytdlpVersion.isEmpty()
        ? QJsonValue(QJsonValue::Null) : QJsonValue(m_tools.ytdlpVersion);

    const QJsonArray endpoints = {
        endpoint("/stream?q=<query>", "Web stream"),
        endpoint("/esp32_stream?song=<song>&singer=<singer>", "ESP32 stream"),
        endpoint("/stream_pcm?song=<song>&singer=<singer>", "ESP32 JSON API"),
        endpoint("/api/music?q=<query>", "Music info API"),
        endpoint("/download?q=<query>", "MP3 download"),
        endpoint("/clear_cache", "Clear resolved URL cache"),
        endpoint("/status", "Server status"),
        endpoint("/stats", "Server statistics"),
        endpoint("/debug", "Request and cache diagnostics"),
    };

    QJsonObject body;
    body[QStringLiteral("status")] = QStringLiteral("running");
    body[QStringLiteral("server")] = QLatin1String(SERVER_NAME);
    body[QStringLiteral("version")] = QLatin1String(SERVER_VERSION);
    body[QStringLiteral("uptime_seconds")] = uptime;
    body[QStringLiteral("uptime_human")] = formatUptime(uptime);
    body[QStringLiteral("start_time")] = m_stats.startTime().toString(Qt::ISODate);
    body[QStringLiteral("current_time")] = QDateTime::currentDateTime().toString(Qt::ISODate);
    body[QStringLiteral("cache_size")] = m_cache.size();
    body[QStringLiteral("cache_max_size")] = m_cache.capacity();
    body[QStringLiteral("cache_duration_seconds")] = static_cast<qint64>(m_cache.ttl().count());
    body[QStringLiteral("active_streams")] = TranscodeEngine::activeSessions();
    body[QStringLiteral("stats")] = m_stats.snapshot().toJson();
    body[QStringLiteral("tools")] = tools;
    body[QStringLiteral("endpoints")] = endpoints;
    body[QStringLiteral("timestamp")] = unixTime();

    sendJson(responder, 200, body);
}

void MusicService::handleStats(const HttpRequest& /*request*/, HttpResponder& responder)
{
    const StatsSnapshot snapshot = m_stats.snapshot();
    const qint64 uptime = m_stats.uptimeSeconds();

    QJsonObject cacheStats;
    cacheStats[QStringLiteral("current_size")] = m_cache.size();
    cacheStats[QStringLiteral("max_size")] = m_cache.capacity();
    cacheStats[QStringLiteral("duration_seconds")] = static_cast<qint64>(m_cache.ttl().count());
    cacheStats[QStringLiteral("hit_rate")] = snapshot.hitRate();

    QJsonObject performance;
    performance[QStringLiteral("uptime_seconds")] = uptime;
    performance[QStringLiteral("requests_per_hour")] = uptime > 0
        ? static_cast<double>(snapshot.totalRequests) / (static_cast<double>(uptime) / 3600.0)
        : 0.0;
    performance[QStringLiteral("success_rate")] = snapshot.successRate();

    sendJson(responder, 200, QJsonObject{
        {QStringLiteral("server_stats"), snapshot.toJson()},
        {QStringLiteral("cache_stats"), cacheStats},
        {QStringLiteral("performance"), performance},
    });
}

void MusicService::handleDebug(const HttpRequest& request, HttpResponder& responder)
{
    const QByteArray userAgent = request.header(QByteArrayLiteral("User-Agent"));

    QJsonObject client;
    client[QStringLiteral("ip")] = request.remoteAddress;
    client[QStringLiteral("user_agent")] = userAgent.isEmpty()
        ? QJsonValue(QJsonValue::Null) : QJsonValue(QString::fromUtf8(userAgent));
    client[QStringLiteral("method")] = QString::fromLatin1(request.method);

    sendJson(responder, 200, QJsonObject{
        {QStringLiteral("client"), client},
        {QStringLiteral("server"), QJsonObject{
            {QStringLiteral("host"), request.host()},
            {QStringLiteral("timestamp"), unixTime()},
        }},
        {QStringLiteral("cache"), QJsonObject{
            {QStringLiteral("size"), m_cache.size()},
            {QStringLiteral("max_size"), m_cache.capacity()},
        }},
    });
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

QString MusicService::downloadFilename(const MediaInfo& info)
{
    QString name = QStringLiteral("%1 - %2").arg(info.title, info.artist);
    name.replace(QLatin1Char('/'), QLatin1Char('_'));
    name.replace(QLatin1Char('\\'), QLatin1Char('_'));

    // Keep the Content-Disposition header well-formed
    name.replace(QLatin1Char('"'), QLatin1Char('\''));
    name.remove(QLatin1Char('\r'));
    name.remove(QLatin1Char('\n'));

    if (name.size() > MAX_FILENAME_LENGTH) {
        name.truncate(MAX_FILENAME_LENGTH);
    }
    return name;
}

void MusicService::sendJson(HttpResponder& responder, int status, const QJsonObject& body)
{
    responder.sendResponse(status,
                           {{CONTENT_TYPE, QByteArrayLiteral("application/json")}},
                           QJsonDocument(body).toJson(QJsonDocument::Compact));
}

void MusicService::sendText(HttpResponder& responder, int status, const QString& text)
{
    responder.sendResponse(status,
                           {{CONTENT_TYPE, QByteArrayLiteral("text/plain; charset=utf-8")}},
                           text.toUtf8());
}

void MusicService::sendInternalError(HttpResponder& responder)
{
    sendJson(responder, 500, QJsonObject{
        {QStringLiteral("error"), QStringLiteral("Internal Server Error")},
        {QStringLiteral("message"), QStringLiteral("Đã xảy ra lỗi server")},
        {QStringLiteral("timestamp"), unixTime()},
    });
}

} // namespace MusicRelay
