/**
 * @file MusicService.h
 * @brief HTTP endpoints of the music relay
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/server/HttpTypes.h"

#include <QHash>
#include <QJsonObject>

#include <functional>

namespace MusicRelay {

class ExtractionBackend;
class StatsRegistry;
class StreamCache;
class StreamLocator;
class TranscodeEngine;
struct OutputProfile;
struct MediaInfo;

/**
 * @brief Versions and availability of the external tools, for /status
 */
struct ToolStatus {
    QString ffmpegVersion;       ///< Empty if ffmpeg is unavailable
    QString ytdlpVersion;        ///< Empty if yt-dlp is unavailable
};

/**
 * @class MusicService
 * @brief Route table and endpoint handlers
 *
 * Handlers run on the connection's worker thread and may block for the
 * lifetime of a stream. Collaborators are borrowed.
 */
class MusicService : public RequestHandler {
public:
    MusicService(StreamLocator& locator, ExtractionBackend& infoBackend, TranscodeEngine& engine,
                 StreamCache& cache, StatsRegistry& stats, ToolStatus tools = {});

    void handle(const HttpRequest& request, HttpResponder& responder) override;

    /**
     * @brief Attachment filename stem "{title} - {artist}", made header-safe
     */
    [[nodiscard]] static QString downloadFilename(const MediaInfo& info);

    static constexpr auto SERVER_NAME = "MusicRelay";
    static constexpr auto SERVER_VERSION = "2.1";

private:
    using Handler = std::function<void(const HttpRequest&, HttpResponder&)>;

    void handleStream(const HttpRequest& request, HttpResponder& responder);
    void handleEsp32Stream(const HttpRequest& request, HttpResponder& responder);
    void handleStreamPcm(const HttpRequest& request, HttpResponder& responder);
    void handleApiMusic(const HttpRequest& request, HttpResponder& responder);
    void handleDownload(const HttpRequest& request, HttpResponder& responder);
    void handleClearCache(const HttpRequest& request, HttpResponder& responder);
    void handleStatus(const HttpRequest& request, HttpResponder& responder);
    void handleStats(const HttpRequest& request, HttpResponder& responder);
    void handleDebug(const HttpRequest& request, HttpResponder& responder);

    /**
     * @brief Transcode audioUrl into a chunked 200 response
     *
     * Headers are committed before the transcoder starts, so a failing
     * transcoder yields an empty or truncated body.
     */
    void streamTranscoded(HttpResponder& responder, const QString& audioUrl,
                          const OutputProfile& profile, const HttpHeaders& headers);

    static void sendJson(HttpResponder& responder, int status, const QJsonObject& body);
    static void sendText(HttpResponder& responder, int status, const QString& text);
    static void sendInternalError(HttpResponder& responder);

    StreamLocator& m_locator;
    ExtractionBackend& m_infoBackend;
    TranscodeEngine& m_engine;
    StreamCache& m_cache;
    StatsRegistry& m_stats;
    ToolStatus m_tools;

    QHash<QString, Handler> m_routes;
};

} // namespace MusicRelay
