/**
 * @file TranscodeEngine.cpp
 * @brief Implementation of the transcoding pipeline
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/stream/TranscodeEngine.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace MusicRelay {

namespace {
    constexpr int VERSION_TIMEOUT_MS = 5000;
}

TranscodeEngine::TranscodeEngine(const QString& ffmpegPath)
    : m_ffmpegPath(ffmpegPath.isEmpty() ? findFfmpeg() : ffmpegPath)
{
}

QString TranscodeEngine::findFfmpeg()
{
    QString path = QStandardPaths::findExecutable(QStringLiteral("ffmpeg"));
    if (path.isEmpty()) {
        path = QStandardPaths::findExecutable(QStringLiteral("ffmpeg"),
                                              {QStringLiteral("/usr/local/bin"), QStringLiteral("/usr/bin")});
    }
    return path;
}

bool TranscodeEngine::isAvailable() const
{
    if (m_ffmpegPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_ffmpegPath);
    return info.exists() && info.isExecutable();
}

QString TranscodeEngine::version() const
{
    if (!isAvailable()) {
        return QString();
    }

    QProcess process;
    process.start(m_ffmpegPath, {QStringLiteral("-version")});

    if (process.waitForFinished(VERSION_TIMEOUT_MS)) {
        const QString output = QString::fromUtf8(process.readAllStandardOutput());
        return output.section(QLatin1Char('\n'), 0, 0).trimmed();
    }

    process.kill();
    process.waitForFinished(VERSION_TIMEOUT_MS);
    return QString();
}

TranscodeCommand TranscodeEngine::buildCommand(const QString& sourceUrl, const OutputProfile& profile) const
{
    return TranscodeCommand{m_ffmpegPath, profile.transcoderArguments(sourceUrl)};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Streaming
// ═══════════════════════════════════════════════════════════════════════════════

StreamOutcome TranscodeEngine::stream(const QString& sourceUrl, const OutputProfile& profile,
                                      const ChunkSink& sink, CancellationToken& token,
                                      const PeerProbe& peerAlive)
{
    StreamOutcome outcome;
    const TranscodeCommand command = buildCommand(sourceUrl, profile);

    StreamSession session(profile);

    // Starting
    if (command.program.isEmpty() || !session.start(command.program, command.arguments)) {
        outcome.state = StreamState::SubprocessError;
        outcome.error = ErrorKind::SubprocessSpawnFailed;
        qCritical() << "TranscodeEngine: Could not start transcoder for profile" << profile.name
                    << ":" << (command.program.isEmpty() ? QStringLiteral("ffmpeg not found") : session.errorString());
        return outcome;
    }

    qInfo() << "TranscodeEngine: Streaming" << profile.name << "profile";

    // Streaming
    QProcess& process = session.process();
    QElapsedTimer sinceLastData;
    sinceLastData.start();
    QElapsedTimer sincePeerCheck;
    sincePeerCheck.start();
    ByteCount nextProgressMark = profile.progressEveryBytes;
    StreamState state = StreamState::Streaming;

    while (state == StreamState::Streaming) {
        if (token.isCancelled()) {
            state = StreamState::ClientDisconnected;
            break;
        }

        session.drainDiagnostics();

        if (process.bytesAvailable() == 0) {
            if (process.state() == QProcess::NotRunning) {
                outcome.exitCode = process.exitCode();
                const bool clean = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
                state = clean ? StreamState::Completed : StreamState::SubprocessError;
                if (!clean) {
                    qWarning() << "TranscodeEngine: Transcoder exited abnormally, code" << process.exitCode();
                }
                break;
            }

            // Nothing is written while the transcoder is silent, so ask the peer directly
            if (peerAlive && sincePeerCheck.elapsed() >= m_peerCheckInterval.count()) {
                sincePeerCheck.restart();
                if (!peerAlive()) {
                    token.cancel();
                    state = StreamState::ClientDisconnected;
                    break;
                }
            }

            if (sinceLastData.elapsed() >= m_stallTimeout.count()) {
                qWarning() << "TranscodeEngine: No output for" << m_stallTimeout.count() << "ms, giving up";
                state = StreamState::SubprocessError;
                break;
            }

            process.waitForReadyRead(static_cast<int>(m_pollInterval.count()));
            continue;
        }

        const QByteArray chunk = process.read(profile.chunkSize);
        if (chunk.isEmpty()) {
            continue;
        }
        sinceLastData.restart();

        if (!sink(chunk)) {
            token.cancel();
            state = StreamState::ClientDisconnected;
            break;
        }

        session.recordChunk(chunk.size());
        logProgress(session, nextProgressMark);
    }

    // Terminated
    session.drainDiagnostics();
    outcome.termination = session.shutdown(m_killGrace);
    outcome.state = state;
    outcome.bytesSent = session.bytesSent();
    outcome.chunksSent = session.chunksSent();
    outcome.elapsedMs = session.elapsedMs();

    if (state == StreamState::SubprocessError) {
        outcome.error = ErrorKind::SubprocessError;
    }

    switch (state) {
        case StreamState::Completed:
            qInfo() << "TranscodeEngine: Stream completed," << formatByteSize(outcome.bytesSent)
                    << "in" << outcome.elapsedMs << "ms";
            break;
        case StreamState::ClientDisconnected:
            qInfo() << "TranscodeEngine: Client disconnected after" << formatByteSize(outcome.bytesSent)
                    << "(" << terminationKindToString(outcome.termination) << ")";
            break;
        default:
            qWarning() << "TranscodeEngine: Stream ended with error after" << formatByteSize(outcome.bytesSent);
            break;
    }

    return outcome;
}

void TranscodeEngine::logProgress(const StreamSession& session, ByteCount& nextMark) const
{
    const OutputProfile& profile = session.profile();
    const double seconds = static_cast<double>(session.elapsedMs()) / 1000.0;

    if (profile.progressEveryBytes > 0) {
        if (session.bytesSent() < nextMark) {
            return;
        }
        while (nextMark <= session.bytesSent()) {
            nextMark += profile.progressEveryBytes;
        }

        const double mb = static_cast<double>(session.bytesSent()) / (1024.0 * 1024.0);
        qInfo().noquote() << QStringLiteral("TranscodeEngine: Streamed %1 MB (%2 MB/s)")
                                 .arg(mb, 0, 'f', 1)
                                 .arg(seconds > 0 ? mb / seconds : 0.0, 0, 'f', 1);
    } else if (profile.progressEveryChunks > 0 && session.chunksSent() % profile.progressEveryChunks == 0) {
        const double kb = static_cast<double>(session.bytesSent()) / 1024.0;
        qInfo().noquote() << QStringLiteral("TranscodeEngine: %1: %2 KB (%3 KB/s)")
                                 .arg(profile.name)
                                 .arg(kb, 0, 'f', 1)
                                 .arg(seconds > 0 ? kb / seconds : 0.0, 0, 'f', 1);
    }
}

} // namespace MusicRelay
