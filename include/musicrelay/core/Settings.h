/**
 * @file Settings.h
 * @brief Server configuration: compiled defaults, INI overrides, command line
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/core/Types.h"

#include <QString>
#include <QStringList>

class QCommandLineParser;

namespace MusicRelay {

/**
 * @brief Application settings
 *
 * Values start from the Config constants, are overridden by an optional INI
 * file and finally by command line options.
 */
struct ServerSettings {
    // Server
    QString host = QStringLiteral("0.0.0.0");
    quint16 port = Config::DEFAULT_PORT;
    int maxConnections = Config::DEFAULT_MAX_CONNECTIONS;

    // External tools (empty = search PATH)
    QString ffmpegPath;
    QString ytdlpPath;

    // Cache
    int cacheTtlSeconds = static_cast<int>(Config::CACHE_TTL.count());
    int cacheCapacity = Config::CACHE_CAPACITY;
    bool singleFlight = true;           ///< Collapse concurrent identical resolutions

    // Network
    int networkTimeoutSeconds = Config::NETWORK_TIMEOUT_SECONDS;
    int extractorTimeoutSeconds = Config::EXTRACTOR_PROCESS_TIMEOUT_SECONDS;
    QString searchEndpoint = QStringLiteral("https://music.youtube.com/youtubei/v1/search");
    QStringList fallbackInstances = defaultFallbackInstances();

    // Streaming
    int killGraceMs = static_cast<int>(Config::KILL_GRACE_PERIOD.count());
    int stallTimeoutMs = static_cast<int>(Config::STALL_TIMEOUT.count());

    bool verbose = false;

    static QStringList defaultFallbackInstances();

    /**
     * @brief Apply overrides from an INI file
     * @return False if the file exists but could not be parsed
     */
    bool loadFromFile(const QString& path);

    /**
     * @brief Register the options understood by applyCommandLine()
     */
    static void addCommandLineOptions(QCommandLineParser& parser);

    /**
     * @brief Apply overrides from a processed command line
     * @return False if the named config file could not be parsed
     */
    [[nodiscard]] bool applyCommandLine(const QCommandLineParser& parser);
};

} // namespace MusicRelay
