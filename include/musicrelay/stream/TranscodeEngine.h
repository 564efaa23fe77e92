/**
 * @file TranscodeEngine.h
 * @brief Subprocess transcoding pipeline feeding an HTTP response
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/core/CancellationToken.h"
#include "musicrelay/core/Types.h"
#include "musicrelay/stream/OutputProfile.h"
#include "musicrelay/stream/StreamSession.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <functional>

namespace MusicRelay {

/**
 * @brief Receives encoded chunks in order
 * @return false if the consumer went away; streaming stops
 */
using ChunkSink = std::function<bool(const QByteArray& chunk)>;

/**
 * @brief Polled while the transcoder is silent
 * @return false once the consumer is gone
 */
using PeerProbe = std::function<bool()>;

/**
 * @brief Program and arguments of a transcoder run
 */
struct TranscodeCommand {
    QString program;
    QStringList arguments;
};

/**
 * @brief Final report of one stream() call
 */
struct StreamOutcome {
    StreamState state = StreamState::Starting;   ///< Completed, ClientDisconnected or SubprocessError
    ErrorKind error = ErrorKind::None;
    ByteCount bytesSent = 0;
    qint64 chunksSent = 0;
    qint64 elapsedMs = 0;
    int exitCode = -1;
    TerminationKind termination = TerminationKind::NotStarted;

    [[nodiscard]] bool completed() const noexcept { return state == StreamState::Completed; }
};

/**
 * @class TranscodeEngine
 * @brief Runs the transcoder for one source and forwards its output
 *
 * stream() blocks the calling thread for the lifetime of the stream:
 *   Starting → Streaming → {Completed, ClientDisconnected, SubprocessError} → Terminated
 *
 * The subprocess is reaped on every path before stream() returns.
 * One engine instance is shared by all request workers.
 */
class TranscodeEngine {
public:
    explicit TranscodeEngine(const QString& ffmpegPath = QString());
    virtual ~TranscodeEngine() = default;

    TranscodeEngine(const TranscodeEngine&) = delete;
    TranscodeEngine& operator=(const TranscodeEngine&) = delete;

    /**
     * @brief Transcode sourceUrl with profile, handing chunks to sink
     *
     * The token is checked at every chunk boundary. A sink returning false
     * cancels it, and so does peerAlive returning false while no output is
     * pending.
     */
    StreamOutcome stream(const QString& sourceUrl, const OutputProfile& profile,
                         const ChunkSink& sink, CancellationToken& token,
                         const PeerProbe& peerAlive = PeerProbe());

    /**
     * @brief Command used to transcode sourceUrl with profile
     */
    [[nodiscard]] virtual TranscodeCommand buildCommand(const QString& sourceUrl,
                                                        const OutputProfile& profile) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Configuration
    // ═══════════════════════════════════════════════════════════════════════════

    void setKillGracePeriod(Duration grace) { m_killGrace = grace; }
    void setStallTimeout(Duration timeout) { m_stallTimeout = timeout; }
    void setPollInterval(Duration interval) { m_pollInterval = interval; }
    void setPeerCheckInterval(Duration interval) { m_peerCheckInterval = interval; }

    [[nodiscard]] Duration killGracePeriod() const noexcept { return m_killGrace; }
    [[nodiscard]] Duration stallTimeout() const noexcept { return m_stallTimeout; }

    // ═══════════════════════════════════════════════════════════════════════════
    // Status
    // ═══════════════════════════════════════════════════════════════════════════

    [[nodiscard]] QString ffmpegPath() const { return m_ffmpegPath; }

    [[nodiscard]] bool isAvailable() const;

    /**
     * @brief First line of `ffmpeg -version`, empty if unavailable
     */
    [[nodiscard]] QString version() const;

    [[nodiscard]] static QString findFfmpeg();

    /**
     * @brief Sessions currently holding a subprocess
     */
    [[nodiscard]] static int activeSessions() noexcept { return StreamSession::liveSessions(); }

private:
    void logProgress(const StreamSession& session, ByteCount& nextMark) const;

    QString m_ffmpegPath;
    Duration m_killGrace = Config::KILL_GRACE_PERIOD;
    Duration m_stallTimeout = Config::STALL_TIMEOUT;
    Duration m_pollInterval = Config::READ_POLL_INTERVAL;
    Duration m_peerCheckInterval = Config::PEER_CHECK_INTERVAL;
};

} // namespace MusicRelay
