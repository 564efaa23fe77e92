/**
 * @file Settings.cpp
 * @brief Loading of server settings
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/core/Settings.h"

#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>
#include <QSettings>

#include <algorithm>

namespace MusicRelay {

QStringList ServerSettings::defaultFallbackInstances()
{
    return {
        QStringLiteral("https://co.wuk.sh"),
        QStringLiteral("https://api.cobalt.best"),
        QStringLiteral("https://cobalt.tools"),
        QStringLiteral("https://cobalt.pub"),
    };
}

bool ServerSettings::loadFromFile(const QString& path)
{
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        qWarning() << "ServerSettings: Config file not found:" << path;
        return true;
    }

    QSettings ini(path, QSettings::IniFormat);
    if (ini.status() != QSettings::NoError) {
        qWarning() << "ServerSettings: Failed to parse" << path;
        return false;
    }

    ini.beginGroup(QStringLiteral("server"));
    host = ini.value(QStringLiteral("host"), host).toString();
    if (ini.contains(QStringLiteral("port"))) {
        bool ok = false;
        const uint value = ini.value(QStringLiteral("port")).toUInt(&ok);
        if (ok && value <= 65535) {
            port = static_cast<quint16>(value);
        } else {
            qWarning() << "ServerSettings: Ignoring invalid port" << ini.value(QStringLiteral("port")).toString()
                       << "in" << path;
        }
    }
    maxConnections = std::max(1, ini.value(QStringLiteral("max_connections"), maxConnections).toInt());
    ini.endGroup();

    ini.beginGroup(QStringLiteral("tools"));
    ffmpegPath = ini.value(QStringLiteral("ffmpeg"), ffmpegPath).toString();
    ytdlpPath = ini.value(QStringLiteral("ytdlp"), ytdlpPath).toString();
    ini.endGroup();

    ini.beginGroup(QStringLiteral("cache"));
    cacheTtlSeconds = std::max(1, ini.value(QStringLiteral("ttl_seconds"), cacheTtlSeconds).toInt());
    cacheCapacity = std::max(1, ini.value(QStringLiteral("capacity"), cacheCapacity).toInt());
    singleFlight = ini.value(QStringLiteral("single_flight"), singleFlight).toBool();
    ini.endGroup();

    ini.beginGroup(QStringLiteral("network"));
    networkTimeoutSeconds = std::max(1, ini.value(QStringLiteral("timeout_seconds"), networkTimeoutSeconds).toInt());
    extractorTimeoutSeconds = std::max(1, ini.value(QStringLiteral("extractor_timeout_seconds"),
                                                    extractorTimeoutSeconds).toInt());
    ini.endGroup();

    ini.beginGroup(QStringLiteral("search"));
    searchEndpoint = ini.value(QStringLiteral("endpoint"), searchEndpoint).toString();
    ini.endGroup();

    ini.beginGroup(QStringLiteral("fallback"));
    const QStringList instances = ini.value(QStringLiteral("instances")).toStringList();
    if (!instances.isEmpty()) {
        fallbackInstances.clear();
        for (const QString& instance : instances) {
            QString trimmed = instance.trimmed();
            while (trimmed.endsWith(QLatin1Char('/'))) {
                trimmed.chop(1);
            }
            if (!trimmed.isEmpty()) {
                fallbackInstances << trimmed;
            }
        }
    }
    ini.endGroup();

    ini.beginGroup(QStringLiteral("stream"));
    killGraceMs = std::max(0, ini.value(QStringLiteral("kill_grace_ms"), killGraceMs).toInt());
    stallTimeoutMs = std::max(1000, ini.value(QStringLiteral("stall_timeout_ms"), stallTimeoutMs).toInt());
    ini.endGroup();

    qInfo() << "ServerSettings: Loaded" << path;
    return true;
}

void ServerSettings::addCommandLineOptions(QCommandLineParser& parser)
{
    parser.addOptions({
        {{QStringLiteral("c"), QStringLiteral("config")},
         QStringLiteral("Read settings from INI <file>."), QStringLiteral("file")},
        {QStringLiteral("host"), QStringLiteral("Listen address."), QStringLiteral("address")},
        {{QStringLiteral("p"), QStringLiteral("port")},
         QStringLiteral("Listen port."), QStringLiteral("port")},
        {QStringLiteral("ffmpeg"), QStringLiteral("Path to the ffmpeg executable."), QStringLiteral("path")},
        {QStringLiteral("yt-dlp"), QStringLiteral("Path to the yt-dlp executable."), QStringLiteral("path")},
        {{QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Enable debug logging.")},
    });
}

bool ServerSettings::applyCommandLine(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("config")) && !loadFromFile(parser.value(QStringLiteral("config")))) {
        return false;
    }
    if (parser.isSet(QStringLiteral("host"))) {
        host = parser.value(QStringLiteral("host"));
    }
    if (parser.isSet(QStringLiteral("port"))) {
        bool ok = false;
        const uint value = parser.value(QStringLiteral("port")).toUInt(&ok);
        if (ok && value <= 65535) {
            port = static_cast<quint16>(value);
        } else {
            qWarning() << "ServerSettings: Ignoring invalid port" << parser.value(QStringLiteral("port"));
        }
    }
    if (parser.isSet(QStringLiteral("ffmpeg"))) {
        ffmpegPath = parser.value(QStringLiteral("ffmpeg"));
    }
    if (parser.isSet(QStringLiteral("yt-dlp"))) {
        ytdlpPath = parser.value(QStringLiteral("yt-dlp"));
    }
    verbose = parser.isSet(QStringLiteral("verbose"));
    return true;
}

} // namespace MusicRelay
