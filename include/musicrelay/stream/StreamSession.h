/**
 * @file StreamSession.h
 * @brief Ownership of one transcoder subprocess
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/core/Types.h"
#include "musicrelay/stream/OutputProfile.h"

#include <QElapsedTimer>
#include <QProcess>

#include <memory>

namespace MusicRelay {

/**
 * @brief How the subprocess ended when the session shut down
 */
enum class TerminationKind : uint8_t {
    NotStarted,
    AlreadyExited,      ///< Exited on its own before shutdown
    Terminated,         ///< Stopped by SIGTERM within the grace period
    Killed              ///< Needed SIGKILL
};

inline QString terminationKindToString(TerminationKind kind) {
    switch (kind) {
        case TerminationKind::NotStarted:    return QStringLiteral("NotStarted");
        case TerminationKind::AlreadyExited: return QStringLiteral("AlreadyExited");
        case TerminationKind::Terminated:    return QStringLiteral("Terminated");
        case TerminationKind::Killed:        return QStringLiteral("Killed");
        default:                             return QStringLiteral("Unknown");
    }
}

/**
 * @class StreamSession
 * @brief A running transcoder and its per-stream bookkeeping
 *
 * The session exclusively owns its QProcess and must be used from the thread
 * that created it. The destructor always reaps the process; a process-wide
 * counter of live sessions is kept for leak checks.
 *
 * Diagnostic output (stderr) is drained by drainDiagnostics(), which never
 * throws and never touches the data channel.
 */
class StreamSession {
public:
    explicit StreamSession(const OutputProfile& profile);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /**
     * @brief Spawn the subprocess
     * @return False if it did not start within the timeout
     */
    [[nodiscard]] bool start(const QString& program, const QStringList& arguments,
                             Duration spawnTimeout = Config::SPAWN_TIMEOUT);

    [[nodiscard]] QProcess& process() noexcept { return *m_process; }

    [[nodiscard]] bool isRunning() const;

    [[nodiscard]] QString errorString() const { return m_process->errorString(); }

    /**
     * @brief Log pending diagnostic lines according to the profile filter
     */
    void drainDiagnostics() noexcept;

    /**
     * @brief Stop the subprocess: SIGTERM, wait up to grace, then SIGKILL
     */
    TerminationKind shutdown(Duration grace);

    void recordChunk(ByteCount bytes) noexcept {
        m_bytesSent += bytes;
        ++m_chunksSent;
    }

    [[nodiscard]] ByteCount bytesSent() const noexcept { return m_bytesSent; }
    [[nodiscard]] qint64 chunksSent() const noexcept { return m_chunksSent; }
    [[nodiscard]] qint64 elapsedMs() const { return m_startTime.elapsed(); }
    [[nodiscard]] const OutputProfile& profile() const noexcept { return m_profile; }

    /**
     * @brief Number of sessions currently alive in the process
     */
    [[nodiscard]] static int liveSessions() noexcept;

private:
    void logDiagnosticLine(const QByteArray& line) const;

    const OutputProfile& m_profile;
    std::unique_ptr<QProcess> m_process;
    bool m_started = false;

    QElapsedTimer m_startTime;
    ByteCount m_bytesSent = 0;
    qint64 m_chunksSent = 0;
    QByteArray m_diagnosticTail;     ///< Incomplete last stderr line
};

} // namespace MusicRelay
