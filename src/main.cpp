/**
 * @file main.cpp
 * @brief MusicRelay server entry point
 *
 * Loads settings, wires the resolution and transcoding pipeline together
 * and serves HTTP until terminated.
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QLoggingCategory>
#include <QUrl>

#include "musicrelay/cache/StreamCache.h"
#include "musicrelay/core/Settings.h"
#include "musicrelay/core/StatsRegistry.h"
#include "musicrelay/resolve/CobaltClient.h"
#include "musicrelay/resolve/ExtractorChain.h"
#include "musicrelay/resolve/Resolver.h"
#include "musicrelay/resolve/StreamLocator.h"
#include "musicrelay/resolve/YouTubeMusicSearch.h"
#include "musicrelay/resolve/YtDlpExtractor.h"
#include "musicrelay/server/HttpServer.h"
#include "musicrelay/server/MusicService.h"
#include "musicrelay/stream/TranscodeEngine.h"
#include "net/CurlWrapper.h"

using namespace MusicRelay;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setOrganizationName(QStringLiteral("MusicRelay"));
    app.setApplicationName(QStringLiteral("musicrelay"));
    app.setApplicationVersion(QLatin1String(MusicService::SERVER_VERSION));

    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss} [%{type}] %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Music search and MP3 streaming server"));
    parser.addHelpOption();
    parser.addVersionOption();
    ServerSettings::addCommandLineOptions(parser);
    parser.process(app);

    ServerSettings settings;
    if (!settings.applyCommandLine(parser)) {
        qCritical() << "Invalid configuration, exiting";
        return 1;
    }

    if (!settings.verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    // Must happen before any worker thread creates a curl handle
    if (!CurlGlobalInit::instance().isValid()) {
        return 1;
    }

    // Resolution pipeline
    StreamCache cache(std::chrono::seconds(settings.cacheTtlSeconds), settings.cacheCapacity);
    YouTubeMusicSearch search(QUrl(settings.searchEndpoint), settings.networkTimeoutSeconds);
    Resolver resolver(search);
    YtDlpExtractor extractor(settings.ytdlpPath, settings.networkTimeoutSeconds,
                             settings.extractorTimeoutSeconds);
    CobaltClient fallback(settings.networkTimeoutSeconds);
    ExtractorChain chain(extractor, fallback, settings.fallbackInstances);
    StatsRegistry stats;
    StreamLocator locator(cache, resolver, chain, stats, settings.singleFlight);

    // Transcoding
    TranscodeEngine engine(settings.ffmpegPath);
    engine.setKillGracePeriod(Duration(settings.killGraceMs));
    engine.setStallTimeout(Duration(settings.stallTimeoutMs));

    ToolStatus tools;
    if (engine.isAvailable()) {
        tools.ffmpegVersion = engine.version();
        qInfo() << "ffmpeg:" << engine.ffmpegPath() << "-" << tools.ffmpegVersion;
    } else {
        qWarning() << "ffmpeg not found, streaming endpoints will fail";
    }
    if (extractor.isAvailable()) {
        tools.ytdlpVersion = extractor.version();
        qInfo() << "yt-dlp:" << extractor.ytDlpPath() << "-" << tools.ytdlpVersion;
    } else {
        qWarning() << "yt-dlp not found, relying on fallback instances";
    }

    MusicService service(locator, extractor, engine, cache, stats, tools);
    HttpServer server(service, settings.maxConnections);

    if (!server.start(settings.host, settings.port)) {
        return 1;
    }

    qInfo() << "MusicRelay" << MusicService::SERVER_VERSION << "listening on"
            << settings.host << "port" << settings.port;
    qInfo() << "Cache TTL:" << settings.cacheTtlSeconds << "s, capacity:" << settings.cacheCapacity
            << ", single-flight:" << (locator.singleFlight() ? "on" : "off");
    qInfo() << "Fallback instances:" << chain.instances().join(QStringLiteral(", "));
    qInfo() << "Transcoder kill grace:" << engine.killGracePeriod().count() << "ms, stall timeout:"
            << engine.stallTimeout().count() << "ms";

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&server]() {
        server.stop();
    });

    return app.exec();
}
