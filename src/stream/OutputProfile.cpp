/**
 * @file OutputProfile.cpp
 * @brief Encoder profile definitions
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/stream/OutputProfile.h"

namespace MusicRelay {

const OutputProfile& OutputProfile::web()
{
    static const OutputProfile profile = [] {
        OutputProfile p;
        p.name = QStringLiteral("web");
        p.sampleRate = 44100;
        p.channels = 2;
        p.bitrateKbps = 192;
        p.bufferSize = QStringLiteral("512k");
        p.maxDelayUs = 500000;
        p.chunkSize = Config::WEB_CHUNK_SIZE;
        p.reconnect = true;
        p.diagnostics = DiagnosticFilter::All;
        p.progressEveryBytes = 1024 * 1024;
        return p;
    }();
    return profile;
}

const OutputProfile& OutputProfile::constrained()
{
    static const OutputProfile profile = [] {
        OutputProfile p;
        p.name = QStringLiteral("constrained");
        p.sampleRate = 24000;
        p.channels = 2;
        p.bitrateKbps = 80;
        p.vbrQuality = 7;
        p.bufferSize = QStringLiteral("160k");
        p.extraArguments = {
            QStringLiteral("-fflags"), QStringLiteral("+discardcorrupt"),
            QStringLiteral("-max_muxing_queue_size"), QStringLiteral("640"),
        };
        p.chunkSize = Config::CONSTRAINED_CHUNK_SIZE;
        p.reconnect = true;
        p.diagnostics = DiagnosticFilter::ErrorsOnly;
        p.progressEveryChunks = 50;
        return p;
    }();
    return profile;
}

const OutputProfile& OutputProfile::download()
{
    static const OutputProfile profile = [] {
        OutputProfile p;
        p.name = QStringLiteral("download");
        p.sampleRate = 44100;
        p.channels = 2;
        p.bitrateKbps = 192;
        p.chunkSize = Config::WEB_CHUNK_SIZE;
        p.reconnect = false;
        p.diagnostics = DiagnosticFilter::ErrorsOnly;
        p.progressEveryBytes = 1024 * 1024;
        return p;
    }();
    return profile;
}

QStringList OutputProfile::transcoderArguments(const QString& sourceUrl) const
{
    QStringList args;
    args << QStringLiteral("-nostdin");

    if (reconnect) {
        args << QStringLiteral("-reconnect") << QStringLiteral("1")
             << QStringLiteral("-reconnect_streamed") << QStringLiteral("1")
             << QStringLiteral("-reconnect_delay_max") << QString::number(reconnectDelayMaxSec);
    }

    args << QStringLiteral("-i") << sourceUrl;
    args << QStringLiteral("-f") << format;
    args << QStringLiteral("-acodec") << codec;
    args << QStringLiteral("-ar") << QString::number(sampleRate);
    args << QStringLiteral("-ac") << QString::number(channels);
    args << QStringLiteral("-b:a") << QStringLiteral("%1k").arg(bitrateKbps);

    if (vbrQuality) {
        args << QStringLiteral("-q:a") << QString::number(*vbrQuality);
    }
    if (!bufferSize.isEmpty()) {
        args << QStringLiteral("-bufsize") << bufferSize;
    }
    if (maxDelayUs > 0) {
        args << QStringLiteral("-max_delay") << QString::number(maxDelayUs);
    }

    args << extraArguments;
    args << QStringLiteral("-vn") << QStringLiteral("-");
    return args;
}

bool OutputProfile::acceptsDiagnostic(const QByteArray& line) const
{
    if (diagnostics == DiagnosticFilter::All) {
        return true;
    }
    const QByteArray lower = line.toLower();
    return lower.contains("error") || lower.contains("invalid");
}

} // namespace MusicRelay
